#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <utility>
#include <boost/asio/any_io_executor.hpp>

#include "mcpevals/infra/child_process.hpp"
#include "mcpevals/mcp/server_type.hpp"
#include "mcpevals/mcp/transport.hpp"

namespace mcpevals::mcp {

/// Newline-delimited JSON-RPC over a child process's stdin/stdout. The
/// process is spawned by start(), not at construction.
class StdioTransport final : public Transport {
public:
    StdioTransport(boost::asio::any_io_executor executor, LaunchCommand command,
                   std::chrono::milliseconds shutdown_grace = std::chrono::seconds(5));
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    auto start(const infra::CancelToken& cancel) -> awaitable<VoidResult> override;
    auto request(const json& message, const infra::CancelToken& cancel)
        -> awaitable<Result<json>> override;
    auto notify(const json& message, const infra::CancelToken& cancel)
        -> awaitable<VoidResult> override;
    auto close() -> awaitable<void> override;

    [[nodiscard]] auto is_alive() -> bool override;
    [[nodiscard]] auto describe() const -> std::string override;

    [[nodiscard]] auto command() const -> const LaunchCommand& { return command_; }

private:
    auto write_message(const json& message, const infra::CancelToken& cancel)
        -> awaitable<VoidResult>;
    auto read_message(const infra::CancelToken& cancel) -> awaitable<Result<json>>;
    auto closed_error(std::string_view what) -> Error;

    boost::asio::any_io_executor executor_;
    LaunchCommand command_;
    std::chrono::milliseconds shutdown_grace_;
    std::unique_ptr<infra::ChildProcess> process_;
    std::string read_buffer_;
    bool broken_ = false;
};

} // namespace mcpevals::mcp
