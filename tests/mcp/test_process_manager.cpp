#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include <utility>
#include <boost/asio.hpp>

#include "mcpevals/infra/cancellation.hpp"
#include "mcpevals/mcp/process_manager.hpp"
#include "../support/run_sync.hpp"

using namespace mcpevals;
using namespace mcpevals::mcp;
using namespace std::chrono_literals;
using mcpevals::testing::run_sync;

namespace {

auto fast_options(int max_attempts) -> ProcessManagerOptions {
    ProcessManagerOptions options;
    options.settle_delay = 50ms;
    options.readiness.interval = 5ms;
    options.readiness.max_attempts = max_attempts;
    return options;
}

// Counts probes; answers once `ready_after` attempts have been made.
auto counting_probe(int& attempts, int ready_after) -> ReadinessProbe {
    return [&attempts, ready_after](const std::string&,
                                    const infra::CancelToken&) -> awaitable<bool> {
        ++attempts;
        co_return ready_after > 0 && attempts >= ready_after;
    };
}

} // anonymous namespace

TEST_CASE("is_server_ready stops at the attempt ceiling", "[mcp][process]") {
    boost::asio::io_context ioc;
    int attempts = 0;
    ServerProcessManager manager(fast_options(4), counting_probe(attempts, 0));

    bool ready = run_sync(ioc, manager.is_server_ready("http://127.0.0.1:9/mcp", {}));
    CHECK_FALSE(ready);
    CHECK(attempts == 4);
}

TEST_CASE("is_server_ready succeeds once the probe answers", "[mcp][process]") {
    boost::asio::io_context ioc;
    int attempts = 0;
    ServerProcessManager manager(fast_options(10), counting_probe(attempts, 3));

    CHECK(run_sync(ioc, manager.is_server_ready("http://127.0.0.1:9/mcp", {})));
    CHECK(attempts == 3);
}

TEST_CASE("is_server_ready respects the time budget", "[mcp][process]") {
    boost::asio::io_context ioc;
    int attempts = 0;
    auto options = fast_options(100);
    options.readiness.interval = 20ms;
    ServerProcessManager manager(options, counting_probe(attempts, 0));

    CHECK_FALSE(run_sync(ioc, manager.is_server_ready("http://127.0.0.1:9/mcp", {}, 50ms)));
    CHECK(attempts < 100);
}

TEST_CASE("is_server_ready returns early on cancellation", "[mcp][process]") {
    boost::asio::io_context ioc;
    int attempts = 0;
    auto options = fast_options(50);
    options.readiness.interval = 1s;
    ServerProcessManager manager(options, counting_probe(attempts, 0));

    auto signal = infra::CancellationSignal::create();
    boost::asio::steady_timer trigger(ioc, 20ms);
    trigger.async_wait([signal](const boost::system::error_code&) { signal->cancel(); });

    auto started = std::chrono::steady_clock::now();
    CHECK_FALSE(run_sync(ioc, manager.is_server_ready("http://127.0.0.1:9/mcp", signal)));
    CHECK(attempts == 1);
    CHECK(std::chrono::steady_clock::now() - started < 1s);
}

TEST_CASE("http_ping_probe fails against a closed port", "[mcp][process]") {
    boost::asio::io_context ioc;
    auto probe = ServerProcessManager::http_ping_probe(1s);
    CHECK_FALSE(run_sync(ioc, probe("http://127.0.0.1:1/mcp", {})));
    CHECK_FALSE(run_sync(ioc, probe("not a url", {})));
}

TEST_CASE("start_server validates its input", "[mcp][process]") {
    boost::asio::io_context ioc;
    ServerProcessManager manager(fast_options(1));
    ServerConfiguration config;

    SECTION("unknown runtime") {
        auto started = run_sync(ioc, manager.start_server(ServerType::Unknown, "/srv/server",
                                                          config, {}));
        REQUIRE_FALSE(started.has_value());
        CHECK(started.error().code() == ErrorCode::InvalidConfig);
        CHECK(started.error().message() == "Unsupported server type: unknown");
    }

    SECTION("missing artifact") {
        auto started = run_sync(ioc, manager.start_server(ServerType::NodeScript,
                                                          "/nonexistent/server.js", config, {}));
        REQUIRE_FALSE(started.has_value());
        CHECK(started.error().code() == ErrorCode::ServerStartFailed);
        CHECK(started.error().message() == "Server file not found");
    }
}

TEST_CASE("start_server reports a process that exits immediately", "[mcp][process]") {
    boost::asio::io_context ioc;
    auto options = fast_options(1);
    options.settle_delay = 300ms;
    ServerProcessManager manager(options);
    ServerConfiguration config;

    // /bin/false exits with status 1 before the settle delay ends.
    auto started = run_sync(ioc, manager.start_server(ServerType::NativeExecutable, "/bin/false",
                                                      config, {}));
    REQUIRE_FALSE(started.has_value());
    CHECK(started.error().code() == ErrorCode::ServerStartFailed);
    CHECK(started.error().message() == "Server process exited immediately with code: 1");
}
