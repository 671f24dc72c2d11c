#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

#include "mcpevals/eval/metrics.hpp"
#include "mcpevals/infra/cancellation.hpp"
#include "mcpevals/mcp/connection_cache.hpp"
#include "../support/fakes.hpp"
#include "../support/run_sync.hpp"

using namespace mcpevals;
using namespace mcpevals::mcp;
using namespace std::chrono_literals;
using mcpevals::testing::FakeTransportFactory;
using mcpevals::testing::run_sync;

namespace {

auto stdio_server(std::string path = "/srv/calc.js") -> ServerConfiguration {
    ServerConfiguration config;
    config.path = std::move(path);
    return config;
}

} // anonymous namespace

TEST_CASE("config_key identifies a server configuration", "[mcp][cache]") {
    ServerConfiguration config;
    config.path = "/srv/calc.js";
    CHECK(ConnectionCache::config_key(config) == "stdio:/srv/calc.js:");

    config.transport = "http";
    config.url = "http://localhost:3000/mcp";
    CHECK(ConnectionCache::config_key(config) == "http:/srv/calc.js:http://localhost:3000/mcp");

    config.args = {"--port", "3000"};
    CHECK(ConnectionCache::config_key(config) ==
          "http:/srv/calc.js:http://localhost:3000/mcp:--port|3000");
}

TEST_CASE("Concurrent requests for one server create one client", "[mcp][cache]") {
    boost::asio::io_context ioc;
    FakeTransportFactory factory;
    factory.delay = 20ms;
    ConnectionCache cache(ioc.get_executor(), factory);
    auto config = stdio_server();

    constexpr int kCallers = 8;
    std::vector<std::shared_ptr<Client>> clients;

    run_sync(ioc, [&]() -> awaitable<void> {
        int pending = kCallers;
        infra::AsyncEvent done(ioc.get_executor());
        for (int i = 0; i < kCallers; ++i) {
            boost::asio::co_spawn(ioc,
                [&]() -> awaitable<void> {
                    auto client = co_await cache.get_or_create_client(config, {});
                    if (client) clients.push_back(*client);
                    if (--pending == 0) done.set();
                },
                boost::asio::detached);
        }
        static_cast<void>(co_await done.wait());
    }());

    CHECK(cache.creations() == 1);
    CHECK(factory.states.size() == 1);
    REQUIRE(clients.size() == kCallers);
    for (const auto& client : clients) CHECK(client == clients.front());
    CHECK(cache.size() == 1);

    run_sync(ioc, cache.close_all());
}

TEST_CASE("Distinct configurations get distinct clients", "[mcp][cache]") {
    boost::asio::io_context ioc;
    FakeTransportFactory factory;
    ConnectionCache cache(ioc.get_executor(), factory);

    auto a = run_sync(ioc, cache.get_or_create_client(stdio_server("/srv/a.js"), {}));
    auto b = run_sync(ioc, cache.get_or_create_client(stdio_server("/srv/b.js"), {}));
    auto a_again = run_sync(ioc, cache.get_or_create_client(stdio_server("/srv/a.js"), {}));
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a_again.has_value());

    CHECK(*a != *b);
    CHECK(*a == *a_again);
    CHECK(cache.creations() == 2);
    CHECK(factory.kinds == std::vector<std::string>{"stdio", "stdio"});

    run_sync(ioc, cache.close_all());
}

TEST_CASE("close_all closes every client and is idempotent", "[mcp][cache]") {
    boost::asio::io_context ioc;
    FakeTransportFactory factory;
    ConnectionCache cache(ioc.get_executor(), factory);

    REQUIRE(run_sync(ioc, cache.get_or_create_client(stdio_server("/srv/a.js"), {})).has_value());
    REQUIRE(run_sync(ioc, cache.get_or_create_client(stdio_server("/srv/b.js"), {})).has_value());
    CHECK(cache.size() == 2);

    run_sync(ioc, cache.close_all());
    CHECK(cache.size() == 0);
    for (const auto& state : factory.states) CHECK(state->closes == 1);

    run_sync(ioc, cache.close_all());
    CHECK(cache.size() == 0);
    for (const auto& state : factory.states) CHECK(state->closes == 1);
}

TEST_CASE("A client whose server exited is replaced", "[mcp][cache]") {
    boost::asio::io_context ioc;
    FakeTransportFactory factory;
    ConnectionCache cache(ioc.get_executor(), factory);
    auto config = stdio_server();

    auto first = run_sync(ioc, cache.get_or_create_client(config, {}));
    REQUIRE(first.has_value());
    factory.states[0]->alive = false;

    auto second = run_sync(ioc, cache.get_or_create_client(config, {}));
    REQUIRE(second.has_value());
    CHECK(*second != *first);
    CHECK(cache.creations() == 2);
    CHECK(factory.states[0]->closes == 1);
    CHECK(cache.size() == 1);

    run_sync(ioc, cache.close_all());
}

TEST_CASE("Failed creation is cached for the run", "[mcp][cache]") {
    boost::asio::io_context ioc;
    FakeTransportFactory factory;
    factory.failure = make_error(ErrorCode::ServerStartFailed, "Server file not found");
    eval::LoggingMetricsCollector metrics;
    ConnectionCache cache(ioc.get_executor(), factory, &metrics);
    auto config = stdio_server();

    auto first = run_sync(ioc, cache.get_or_create_client(config, {}));
    auto second = run_sync(ioc, cache.get_or_create_client(config, {}));
    REQUIRE_FALSE(first.has_value());
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().message() == "Server file not found");
    CHECK(cache.creations() == 1);

    auto snapshot = metrics.snapshot();
    CHECK(snapshot.connection_attempts == 1);
    CHECK(snapshot.connection_failures == 1);

    CHECK_FALSE(run_sync(ioc, cache.test_connection(config, {})));
    run_sync(ioc, cache.close_all());
}

TEST_CASE("Cancelled creation is not cached", "[mcp][cache]") {
    boost::asio::io_context ioc;
    FakeTransportFactory factory;
    factory.delay = 1s;
    ConnectionCache cache(ioc.get_executor(), factory);
    auto config = stdio_server();

    auto signal = infra::CancellationSignal::create();
    boost::asio::steady_timer trigger(ioc, 10ms);
    trigger.async_wait([signal](const boost::system::error_code&) { signal->cancel(); });

    auto cancelled = run_sync(ioc, cache.get_or_create_client(config, signal));
    REQUIRE_FALSE(cancelled.has_value());
    CHECK(cancelled.error().code() == ErrorCode::Cancelled);
    CHECK(cache.size() == 0);

    factory.delay = 0ms;
    auto retried = run_sync(ioc, cache.get_or_create_client(config, {}));
    CHECK(retried.has_value());
    CHECK(cache.creations() == 2);

    run_sync(ioc, cache.close_all());
}

TEST_CASE("test_connection requires at least one tool", "[mcp][cache]") {
    boost::asio::io_context ioc;
    FakeTransportFactory factory;
    ConnectionCache cache(ioc.get_executor(), factory);

    CHECK(run_sync(ioc, cache.test_connection(stdio_server(), {})));
    run_sync(ioc, cache.close_all());
}
