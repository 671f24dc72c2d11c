#pragma once

#include <string>

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "mcpevals/core/error.hpp"
#include "mcpevals/infra/cancellation.hpp"

namespace mcpevals::mcp {

using json = nlohmann::json;
using boost::asio::awaitable;

/// A channel to one server. Implementations need not support concurrent
/// requests; Client serializes access.
class Transport {
public:
    virtual ~Transport() = default;

    /// Establishes the channel (spawning the server for stdio).
    virtual auto start(const infra::CancelToken& cancel) -> awaitable<VoidResult> = 0;

    /// Sends a request and returns the response carrying the same id.
    virtual auto request(const json& message, const infra::CancelToken& cancel)
        -> awaitable<Result<json>> = 0;

    /// Sends a message that expects no response.
    virtual auto notify(const json& message, const infra::CancelToken& cancel)
        -> awaitable<VoidResult> = 0;

    /// Releases the channel and any process it owns. Safe to call repeatedly.
    virtual auto close() -> awaitable<void> = 0;

    /// False once an owned server process has exited or the channel broke.
    [[nodiscard]] virtual auto is_alive() -> bool = 0;

    [[nodiscard]] virtual auto describe() const -> std::string = 0;
};

} // namespace mcpevals::mcp
