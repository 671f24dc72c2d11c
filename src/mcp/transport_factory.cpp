#include "mcpevals/mcp/transport_factory.hpp"
#include "mcpevals/core/logger.hpp"
#include "mcpevals/core/utils.hpp"
#include "mcpevals/mcp/server_type.hpp"
#include "mcpevals/mcp/stdio_transport.hpp"

#include <boost/asio/this_coro.hpp>

namespace mcpevals::mcp {

TransportCreationService::TransportCreationService(ServerProcessManager& processes,
                                                   TransportCreationOptions options)
    : processes_(processes)
    , options_(options) {}

auto TransportCreationService::create(std::string_view kind, const ServerConfiguration& config,
                                      const infra::CancelToken& cancel)
    -> awaitable<Result<std::unique_ptr<Transport>>> {
    if (infra::is_cancelled(cancel)) co_return make_fail(infra::cancelled_error());

    if (kind == "http") co_return co_await create_http(config, cancel);
    if (kind == "stdio") co_return co_await create_stdio(config);

    co_return make_fail(make_error(ErrorCode::InvalidConfig,
                                   "Unsupported transport type: " + std::string(kind)));
}

auto TransportCreationService::create_http(const ServerConfiguration& config,
                                           const infra::CancelToken& cancel)
    -> awaitable<Result<std::unique_ptr<Transport>>> {
    auto url_text = utils::trim(config.url);
    if (url_text.empty()) {
        co_return make_fail(make_error(
            ErrorCode::InvalidConfig,
            "HTTP transport requires a 'url' field in server configuration"));
    }
    auto url = utils::parse_http_url(url_text);
    if (!url) {
        co_return make_fail(make_error(ErrorCode::InvalidConfig,
                                       "Invalid HTTP URL: " + url_text));
    }

    auto path = utils::trim(config.path);
    if (path.empty()) {
        LOG_INFO("Connecting to running HTTP server at {}", url_text);
        co_return std::make_unique<HttpTransport>(std::move(*url), nullptr, options_.http);
    }

    auto type = detect_server_type(path);
    auto started = co_await processes_.start_server(type, path, config, cancel);
    if (!started) co_return make_fail(started.error());
    auto process = std::move(*started);

    auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::seconds(config.timeout_seconds));
    bool ready = co_await processes_.is_server_ready(url_text, cancel, budget);
    if (!ready) {
        co_await process->terminate(options_.http.shutdown_grace);
        if (infra::is_cancelled(cancel)) co_return make_fail(infra::cancelled_error());
        co_return make_fail(make_error(ErrorCode::ServerStartFailed,
                                       "Server did not become ready at " + url_text,
                                       utils::truncate(utils::trim(process->output_tail()), 500)));
    }

    co_return std::make_unique<HttpTransport>(std::move(*url), std::move(process),
                                              options_.http);
}

auto TransportCreationService::create_stdio(const ServerConfiguration& config)
    -> awaitable<Result<std::unique_ptr<Transport>>> {
    auto path = utils::trim(config.path);
    if (path.empty()) {
        co_return make_fail(make_error(
            ErrorCode::InvalidConfig,
            "Stdio transport requires a 'path' field in server configuration"));
    }

    auto type = detect_server_type(path);
    auto command = build_launch_command(type, path, config.args);
    LOG_DEBUG("Stdio server {} detected as {}", path, server_type_to_string(type));

    auto executor = co_await boost::asio::this_coro::executor;
    co_return std::make_unique<StdioTransport>(executor, std::move(command),
                                               options_.stdio_shutdown_grace);
}

} // namespace mcpevals::mcp
