#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "mcpevals/core/error.hpp"
#include "mcpevals/infra/cancellation.hpp"

namespace mcpevals::providers {

using json = nlohmann::json;
using boost::asio::awaitable;

struct ChatMessage {
    std::string role;  // "user" or "assistant"
    std::string content;
};

/// Request to send to a language model for completion.
struct CompletionRequest {
    std::string model;
    std::optional<std::string> system_prompt;
    std::vector<ChatMessage> messages;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    bool json_output = false;  // constrain the reply to one JSON object
};

struct CompletionResponse {
    std::string text;
    std::string model;
    int input_tokens = 0;
    int output_tokens = 0;
    std::string stop_reason;
};

/// Connection settings shared by the HTTP providers.
struct ProviderConfig {
    std::string api_key;
    std::string base_url;     // scheme://host[:port]; empty selects the provider default
    std::string path_prefix;  // prepended to API paths, e.g. a gateway mount point
    std::string model;
    int timeout_seconds = 120;
};

struct GenerateOptions {
    std::string model;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    bool json_output = false;
};

/// A language model reached over some API.
class Provider {
public:
    virtual ~Provider() = default;

    virtual auto complete(CompletionRequest req, const infra::CancelToken& cancel)
        -> awaitable<Result<CompletionResponse>> = 0;

    /// Return the provider name (e.g. "anthropic", "openai").
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// Single-turn system + user exchange returning the reply text.
    auto generate(std::string system_prompt, std::string user_prompt,
                  GenerateOptions options, const infra::CancelToken& cancel)
        -> awaitable<Result<std::string>>;
};

/// Extracts a readable message from a provider's error body.
auto describe_http_error(std::string_view provider, int status, const std::string& body) -> Error;

} // namespace mcpevals::providers
