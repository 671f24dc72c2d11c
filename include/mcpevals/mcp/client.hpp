#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "mcpevals/core/error.hpp"
#include "mcpevals/infra/cancellation.hpp"
#include "mcpevals/infra/sync.hpp"
#include "mcpevals/mcp/protocol.hpp"
#include "mcpevals/mcp/transport.hpp"

namespace mcpevals::mcp {

struct ClientInfo {
    std::string name = "mcpevals";
    std::string version = "0.1.0";
};

/// MCP client over one transport. All calls are serialized: a transport such
/// as a stdio pipe carries one request at a time, and concurrent evaluations
/// share a single cached client.
class Client {
public:
    Client(boost::asio::any_io_executor executor, std::unique_ptr<Transport> transport,
           ClientInfo info = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Starts the transport and performs the initialize handshake.
    auto connect(const infra::CancelToken& cancel) -> awaitable<VoidResult>;

    /// All advertised tools, following pagination cursors.
    auto list_tools(const infra::CancelToken& cancel) -> awaitable<Result<std::vector<Tool>>>;

    auto call_tool(std::string_view name, const json& arguments,
                   const infra::CancelToken& cancel) -> awaitable<Result<ToolCallResult>>;

    auto close() -> awaitable<void>;

    [[nodiscard]] auto is_connected() const noexcept -> bool { return connected_; }
    [[nodiscard]] auto is_alive() -> bool;
    [[nodiscard]] auto server_info() const -> const json& { return server_info_; }
    [[nodiscard]] auto describe() const -> std::string;

private:
    /// One request/response exchange. Caller holds mutex_.
    auto call(std::string_view method, json params, const infra::CancelToken& cancel)
        -> awaitable<Result<json>>;

    std::unique_ptr<Transport> transport_;
    ClientInfo info_;
    infra::AsyncMutex mutex_;
    int64_t next_id_ = 1;
    bool connected_ = false;
    json server_info_ = json::object();
};

} // namespace mcpevals::mcp
