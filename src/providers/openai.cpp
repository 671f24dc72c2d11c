#include "mcpevals/providers/openai.hpp"
#include "mcpevals/core/logger.hpp"

namespace mcpevals::providers {

namespace {

constexpr auto kDefaultBaseUrl = "https://api.openai.com";
constexpr auto kDefaultModel = "gpt-4o";
constexpr auto kChatPath = "/v1/chat/completions";

auto make_http_config(const ProviderConfig& config, OpenAIProvider::Flavor flavor)
    -> infra::HttpClientConfig {
    infra::HttpClientConfig http{
        .base_url = config.base_url.empty() ? std::string(kDefaultBaseUrl) : config.base_url,
        .timeout_seconds = config.timeout_seconds,
    };
    if (flavor == OpenAIProvider::Flavor::Azure) {
        http.default_headers["api-key"] = config.api_key;
    } else {
        http.default_headers["Authorization"] = "Bearer " + config.api_key;
    }
    return http;
}

auto make_path(const ProviderConfig& config, OpenAIProvider::Flavor flavor) -> std::string {
    auto prefix = config.path_prefix;
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();

    if (flavor == OpenAIProvider::Flavor::Azure) {
        return prefix + "/openai/deployments/" + config.model + "/chat/completions?api-version=" +
               std::string(OpenAIProvider::kAzureApiVersion);
    }
    // A base URL that already ends in /v1 keeps it once.
    if (prefix.ends_with("/v1")) return prefix + "/chat/completions";
    return prefix + kChatPath;
}

} // anonymous namespace

OpenAIProvider::OpenAIProvider(const ProviderConfig& config, Flavor flavor)
    : flavor_(flavor)
    , default_model_(config.model.empty() ? std::string(kDefaultModel) : config.model)
    , path_(make_path(config, flavor))
    , http_(make_http_config(config, flavor)) {
    LOG_INFO("{} provider initialized (model: {}, base: {})", name(), default_model_,
             http_.base_url());
}

OpenAIProvider::~OpenAIProvider() = default;

auto OpenAIProvider::build_request_body(const CompletionRequest& req) const -> json {
    json body;
    body["model"] = req.model.empty() ? default_model_ : req.model;

    json messages = json::array();
    if (req.system_prompt.has_value() && !req.system_prompt->empty()) {
        messages.push_back({{"role", "system"}, {"content", *req.system_prompt}});
    }
    for (const auto& msg : req.messages) {
        messages.push_back({{"role", msg.role}, {"content", msg.content}});
    }
    body["messages"] = std::move(messages);

    if (req.temperature.has_value()) body["temperature"] = *req.temperature;
    if (req.max_tokens.has_value()) body["max_tokens"] = *req.max_tokens;
    if (req.json_output) body["response_format"] = {{"type", "json_object"}};
    return body;
}

auto OpenAIProvider::parse_response(const std::string& body) -> Result<CompletionResponse> {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Failed to parse OpenAI response", e.what()));
    }

    if (j.contains("error") && !j["error"].is_null()) {
        return std::unexpected(make_error(ErrorCode::ProviderError, "OpenAI API error",
                                          j["error"].value("message", "Unknown error")));
    }

    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        return std::unexpected(make_error(ErrorCode::ProviderError,
                                          "OpenAI response contains no choices"));
    }

    CompletionResponse response;
    response.model = j.value("model", "");
    const auto& choice = j["choices"][0];
    response.stop_reason = choice.value("finish_reason", "");
    if (choice.contains("message") && choice["message"].contains("content") &&
        choice["message"]["content"].is_string()) {
        response.text = choice["message"]["content"].get<std::string>();
    }
    if (j.contains("usage") && j["usage"].is_object()) {
        response.input_tokens = j["usage"].value("prompt_tokens", 0);
        response.output_tokens = j["usage"].value("completion_tokens", 0);
    }
    return response;
}

auto OpenAIProvider::complete(CompletionRequest req, const infra::CancelToken& cancel)
    -> awaitable<Result<CompletionResponse>> {
    auto body = build_request_body(req);
    LOG_DEBUG("{} complete request: model={}", name(), body.value("model", ""));

    auto result = co_await http_.post(path_, body.dump(), "application/json", {}, cancel);
    if (!result) {
        if (result.error().code() == ErrorCode::Cancelled) co_return make_fail(result.error());
        co_return make_fail(make_error(ErrorCode::ConnectionFailed,
                                       std::string(name()) + " API request failed",
                                       result.error().what()));
    }

    if (!result->is_success()) {
        co_return make_fail(describe_http_error(name(), result->status, result->body));
    }
    co_return parse_response(result->body);
}

auto OpenAIProvider::name() const -> std::string_view {
    return flavor_ == Flavor::Azure ? "azure-openai" : "openai";
}

} // namespace mcpevals::providers
