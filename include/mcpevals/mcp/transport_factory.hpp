#pragma once

#include <chrono>
#include <memory>
#include <string_view>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "mcpevals/core/config.hpp"
#include "mcpevals/core/error.hpp"
#include "mcpevals/infra/cancellation.hpp"
#include "mcpevals/mcp/http_transport.hpp"
#include "mcpevals/mcp/process_manager.hpp"
#include "mcpevals/mcp/transport.hpp"

namespace mcpevals::mcp {

/// Builds the transport for a resolved transport kind.
class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    virtual auto create(std::string_view kind, const ServerConfiguration& config,
                        const infra::CancelToken& cancel)
        -> awaitable<Result<std::unique_ptr<Transport>>> = 0;
};

struct TransportCreationOptions {
    HttpTransportOptions http;
    std::chrono::milliseconds stdio_shutdown_grace{std::chrono::seconds(5)};
};

/// http with a path launches the server and waits for readiness before
/// returning. http without a path connects to a server that is assumed to be
/// running. stdio never launches here: the transport spawns its process when
/// the client first starts it.
class TransportCreationService final : public TransportFactory {
public:
    explicit TransportCreationService(ServerProcessManager& processes,
                                      TransportCreationOptions options = {});

    auto create(std::string_view kind, const ServerConfiguration& config,
                const infra::CancelToken& cancel)
        -> awaitable<Result<std::unique_ptr<Transport>>> override;

private:
    auto create_http(const ServerConfiguration& config, const infra::CancelToken& cancel)
        -> awaitable<Result<std::unique_ptr<Transport>>>;
    auto create_stdio(const ServerConfiguration& config)
        -> awaitable<Result<std::unique_ptr<Transport>>>;

    ServerProcessManager& processes_;
    TransportCreationOptions options_;
};

} // namespace mcpevals::mcp
