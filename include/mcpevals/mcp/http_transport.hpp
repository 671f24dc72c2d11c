#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "mcpevals/core/utils.hpp"
#include "mcpevals/infra/child_process.hpp"
#include "mcpevals/infra/http_client.hpp"
#include "mcpevals/mcp/transport.hpp"

namespace mcpevals::mcp {

struct HttpTransportOptions {
    int request_timeout_seconds = 60;
    std::chrono::milliseconds shutdown_grace{std::chrono::seconds(5)};
};

/// JSON-RPC over HTTP POST. Replies may be plain JSON or an SSE stream. When
/// the harness launched the server, the transport owns that process.
class HttpTransport final : public Transport {
public:
    HttpTransport(utils::HttpUrl url,
                  std::unique_ptr<infra::ChildProcess> process = nullptr,
                  HttpTransportOptions options = {});
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    auto start(const infra::CancelToken& cancel) -> awaitable<VoidResult> override;
    auto request(const json& message, const infra::CancelToken& cancel)
        -> awaitable<Result<json>> override;
    auto notify(const json& message, const infra::CancelToken& cancel)
        -> awaitable<VoidResult> override;
    auto close() -> awaitable<void> override;

    [[nodiscard]] auto is_alive() -> bool override;
    [[nodiscard]] auto describe() const -> std::string override;

    [[nodiscard]] auto owns_process() const noexcept -> bool { return process_ != nullptr; }

private:
    auto post(const json& message, const infra::CancelToken& cancel)
        -> awaitable<Result<infra::HttpResponse>>;

    utils::HttpUrl url_;
    std::unique_ptr<infra::ChildProcess> process_;
    HttpTransportOptions options_;
    infra::HttpClient http_;
    std::string session_id_;
    bool closed_ = false;
};

/// Finds the JSON-RPC message with `id` in an SSE body.
auto find_sse_message(std::string_view body, const json& id) -> std::optional<json>;

} // namespace mcpevals::mcp
