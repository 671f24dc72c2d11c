#include "mcpevals/providers/provider.hpp"
#include "mcpevals/core/logger.hpp"
#include "mcpevals/core/utils.hpp"

namespace mcpevals::providers {

auto Provider::generate(std::string system_prompt, std::string user_prompt,
                        GenerateOptions options, const infra::CancelToken& cancel)
    -> awaitable<Result<std::string>> {
    CompletionRequest req;
    req.model = std::move(options.model);
    if (!system_prompt.empty()) req.system_prompt = std::move(system_prompt);
    req.messages.push_back(ChatMessage{.role = "user", .content = std::move(user_prompt)});
    req.temperature = options.temperature;
    req.max_tokens = options.max_tokens;
    req.json_output = options.json_output;

    auto response = co_await complete(std::move(req), cancel);
    if (!response) co_return make_fail(response.error());

    LOG_DEBUG("{} returned {} chars ({} in / {} out tokens)", name(), response->text.size(),
              response->input_tokens, response->output_tokens);
    co_return std::move(response->text);
}

auto describe_http_error(std::string_view provider, int status, const std::string& body) -> Error {
    auto label = std::string(provider) + " API error (HTTP " + std::to_string(status) + ")";
    auto parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error")) {
        const auto& err = parsed["error"];
        if (err.is_object()) {
            return make_error(ErrorCode::ProviderError, label, err.value("message", body));
        }
        if (err.is_string()) {
            return make_error(ErrorCode::ProviderError, label, err.get<std::string>());
        }
    }
    return make_error(ErrorCode::ProviderError, label, utils::truncate(body, 500));
}

} // namespace mcpevals::providers
