#include "mcpevals/providers/anthropic.hpp"
#include "mcpevals/core/logger.hpp"

#include <algorithm>

namespace mcpevals::providers {

namespace {

constexpr auto kDefaultBaseUrl = "https://api.anthropic.com";
constexpr auto kDefaultModel = "claude-sonnet-4-20250514";
constexpr auto kApiVersion = "2023-06-01";
constexpr auto kMessagesPath = "/v1/messages";
constexpr int kDefaultMaxTokens = 4096;
constexpr auto kJsonInstruction =
    "Respond with a single valid JSON object and nothing else.";

auto make_path(const ProviderConfig& config) -> std::string {
    auto prefix = config.path_prefix;
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    return prefix + kMessagesPath;
}

} // anonymous namespace

AnthropicProvider::AnthropicProvider(const ProviderConfig& config)
    : default_model_(config.model.empty() ? std::string(kDefaultModel) : config.model)
    , path_(make_path(config))
    , http_(infra::HttpClientConfig{
          .base_url = config.base_url.empty() ? std::string(kDefaultBaseUrl) : config.base_url,
          .timeout_seconds = config.timeout_seconds,
          .default_headers = {
              {"x-api-key", config.api_key},
              {"anthropic-version", kApiVersion},
          },
      }) {
    LOG_INFO("Anthropic provider initialized (model: {}, base: {})", default_model_,
             http_.base_url());
}

AnthropicProvider::~AnthropicProvider() = default;

auto AnthropicProvider::build_request_body(const CompletionRequest& req) const -> json {
    json body;
    body["model"] = req.model.empty() ? default_model_ : req.model;

    std::string system = req.system_prompt.value_or("");
    if (req.json_output) {
        if (!system.empty()) system += "\n\n";
        system += kJsonInstruction;
    }
    if (!system.empty()) body["system"] = system;

    json messages = json::array();
    for (const auto& msg : req.messages) {
        json content = json::array();
        content.push_back({{"type", "text"}, {"text", msg.content}});
        messages.push_back({{"role", msg.role == "assistant" ? "assistant" : "user"},
                            {"content", std::move(content)}});
    }
    body["messages"] = std::move(messages);

    body["max_tokens"] = req.max_tokens.value_or(kDefaultMaxTokens);
    if (req.temperature.has_value()) {
        // The Messages API caps temperature at 1.0.
        body["temperature"] = std::min(*req.temperature, 1.0);
    }
    return body;
}

auto AnthropicProvider::parse_response(const std::string& body) -> Result<CompletionResponse> {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Failed to parse Anthropic response", e.what()));
    }

    if (j.contains("error")) {
        auto err_msg = j["error"].value("message", "Unknown error");
        auto err_type = j["error"].value("type", "api_error");
        return std::unexpected(make_error(ErrorCode::ProviderError,
                                          "Anthropic API error: " + err_type, err_msg));
    }

    CompletionResponse response;
    response.model = j.value("model", "");
    response.stop_reason = j.value("stop_reason", "");

    if (j.contains("usage")) {
        response.input_tokens = j["usage"].value("input_tokens", 0);
        response.output_tokens = j["usage"].value("output_tokens", 0);
    }

    if (j.contains("content") && j["content"].is_array()) {
        for (const auto& block : j["content"]) {
            if (block.value("type", "") == "text") {
                response.text += block.value("text", "");
            }
        }
    }
    return response;
}

auto AnthropicProvider::complete(CompletionRequest req, const infra::CancelToken& cancel)
    -> awaitable<Result<CompletionResponse>> {
    auto body = build_request_body(req);
    LOG_DEBUG("Anthropic complete request: model={}", body.value("model", ""));

    auto result = co_await http_.post(path_, body.dump(), "application/json", {}, cancel);
    if (!result) {
        if (result.error().code() == ErrorCode::Cancelled) co_return make_fail(result.error());
        co_return make_fail(make_error(ErrorCode::ConnectionFailed,
                                       "Anthropic API request failed", result.error().what()));
    }

    if (!result->is_success()) {
        co_return make_fail(describe_http_error(name(), result->status, result->body));
    }
    co_return parse_response(result->body);
}

auto AnthropicProvider::name() const -> std::string_view {
    return "anthropic";
}

} // namespace mcpevals::providers
