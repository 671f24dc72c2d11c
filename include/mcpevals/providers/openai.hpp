#pragma once

#include <string>
#include <string_view>

#include "mcpevals/infra/http_client.hpp"
#include "mcpevals/providers/provider.hpp"

namespace mcpevals::providers {

/// OpenAI Chat Completions provider.
///
/// Standard flavor talks to https://api.openai.com/v1/chat/completions (or
/// any compatible base URL) with Bearer auth. Azure flavor addresses a
/// deployment at
/// {endpoint}/openai/deployments/{deployment}/chat/completions?api-version=...
/// with an `api-key` header; the configured model name is the deployment.
class OpenAIProvider final : public Provider {
public:
    enum class Flavor { Standard, Azure };

    static constexpr std::string_view kAzureApiVersion = "2024-06-01";

    explicit OpenAIProvider(const ProviderConfig& config, Flavor flavor = Flavor::Standard);
    ~OpenAIProvider() override;

    OpenAIProvider(const OpenAIProvider&) = delete;
    OpenAIProvider& operator=(const OpenAIProvider&) = delete;

    auto complete(CompletionRequest req, const infra::CancelToken& cancel)
        -> awaitable<Result<CompletionResponse>> override;

    [[nodiscard]] auto name() const -> std::string_view override;

    /// Request path relative to the base URL.
    [[nodiscard]] auto completions_path() const -> const std::string& { return path_; }

    /// Build the JSON request body for the Chat Completions API.
    [[nodiscard]] auto build_request_body(const CompletionRequest& req) const -> json;

    /// Parse a response body into a CompletionResponse.
    [[nodiscard]] static auto parse_response(const std::string& body) -> Result<CompletionResponse>;

private:
    Flavor flavor_;
    std::string default_model_;
    std::string path_;
    infra::HttpClient http_;
};

} // namespace mcpevals::providers
