#pragma once

#include <string>
#include <string_view>

#include "mcpevals/infra/http_client.hpp"
#include "mcpevals/providers/provider.hpp"

namespace mcpevals::providers {

/// Anthropic Claude provider.
///
/// Communicates with the Anthropic Messages API at
/// https://api.anthropic.com/v1/messages
///
/// The Messages API has no JSON response mode, so `json_output` requests add
/// an instruction to the system prompt instead.
class AnthropicProvider final : public Provider {
public:
    /// The config must contain at least `api_key`. Optional fields:
    ///   - base_url (default: "https://api.anthropic.com")
    ///   - model (default: "claude-sonnet-4-20250514")
    explicit AnthropicProvider(const ProviderConfig& config);
    ~AnthropicProvider() override;

    AnthropicProvider(const AnthropicProvider&) = delete;
    AnthropicProvider& operator=(const AnthropicProvider&) = delete;

    auto complete(CompletionRequest req, const infra::CancelToken& cancel)
        -> awaitable<Result<CompletionResponse>> override;

    [[nodiscard]] auto name() const -> std::string_view override;

    /// Build the JSON request body for the Messages API.
    [[nodiscard]] auto build_request_body(const CompletionRequest& req) const -> json;

    /// Parse a non-streaming response body into a CompletionResponse.
    [[nodiscard]] static auto parse_response(const std::string& body) -> Result<CompletionResponse>;

private:
    std::string default_model_;
    std::string path_;
    infra::HttpClient http_;
};

} // namespace mcpevals::providers
