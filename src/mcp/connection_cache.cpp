#include "mcpevals/mcp/connection_cache.hpp"
#include "mcpevals/core/logger.hpp"
#include "mcpevals/core/utils.hpp"
#include "mcpevals/mcp/transport_resolver.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

namespace mcpevals::mcp {

namespace {

constexpr int kMaxCreateAttempts = 2;

auto describe_target(const ServerConfiguration& config) -> std::string {
    return config.path.empty() ? config.url : config.path;
}

} // anonymous namespace

ConnectionCache::ConnectionCache(boost::asio::any_io_executor executor, TransportFactory& factory,
                                 eval::MetricsCollector* metrics)
    : executor_(std::move(executor))
    , factory_(factory)
    , metrics_(metrics) {}

ConnectionCache::~ConnectionCache() {
    if (!entries_.empty()) {
        LOG_WARN("Connection cache destroyed with {} open entries; close_all() was not awaited",
                 entries_.size());
    }
}

auto ConnectionCache::config_key(const ServerConfiguration& config) -> std::string {
    std::vector<std::string> parts{
        config.transport.empty() ? std::string("stdio") : config.transport,
        config.path,
        config.url,
    };
    if (!config.args.empty()) parts.push_back(utils::join(config.args, "|"));
    return utils::join(parts, ":");
}

auto ConnectionCache::get_or_create_client(const ServerConfiguration& config,
                                           const infra::CancelToken& cancel)
    -> awaitable<Result<std::shared_ptr<Client>>> {
    auto key = config_key(config);

    for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
        if (infra::is_cancelled(cancel)) co_return make_fail(infra::cancelled_error());

        auto [it, inserted] = entries_.try_emplace(key);
        if (inserted) it->second = std::make_shared<Entry>(executor_);
        auto entry = it->second;

        if (inserted) {
            co_await populate(*entry, config, cancel);
            if (entry->error && entry->error->code() == ErrorCode::Cancelled) {
                erase_if_current(key, entry);
            }
        } else if (!entry->ready.is_set()) {
            auto waited = co_await entry->ready.wait(cancel);
            if (!waited) co_return make_fail(waited.error());
        }

        if (entry->error) co_return make_fail(*entry->error);

        if (entry->client->is_alive()) co_return entry->client;

        LOG_WARN("Cached server for {} is no longer running; reconnecting", key);
        erase_if_current(key, entry);
        co_await entry->client->close();
    }

    co_return make_fail(make_error(ErrorCode::ConnectionFailed,
                                   "Server exited again right after reconnecting", key));
}

auto ConnectionCache::populate(Entry& entry, const ServerConfiguration& config,
                               const infra::CancelToken& cancel) -> awaitable<void> {
    auto target = describe_target(config);
    auto started = std::chrono::steady_clock::now();
    if (metrics_) metrics_->connection_attempt(target);

    auto kind = resolve_transport_type(config);
    ++creations_;
    auto transport = co_await factory_.create(kind, config, cancel);
    if (!transport) {
        entry.error = transport.error();
    } else {
        auto client = std::make_shared<Client>(executor_, std::move(*transport));
        auto connected = co_await client->connect(cancel);
        if (connected) {
            entry.client = std::move(client);
        } else {
            entry.error = connected.error();
            co_await client->close();
        }
    }

    if (entry.error) {
        LOG_ERROR("Failed to connect to {}: {}", target, entry.error->what());
        if (metrics_) metrics_->connection_failed(target, *entry.error);
    } else if (metrics_) {
        metrics_->connection_succeeded(target,
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started));
    }
    entry.ready.set();
}

void ConnectionCache::erase_if_current(const std::string& key,
                                       const std::shared_ptr<Entry>& entry) {
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second == entry) entries_.erase(it);
}

auto ConnectionCache::test_connection(const ServerConfiguration& config,
                                      const infra::CancelToken& cancel) -> awaitable<bool> {
    auto client = co_await get_or_create_client(config, cancel);
    if (!client) {
        LOG_WARN("Connectivity check failed: {}", client.error().what());
        co_return false;
    }

    auto tools = co_await (*client)->list_tools(cancel);
    if (!tools) {
        LOG_WARN("Listing tools failed: {}", tools.error().what());
        co_return false;
    }
    if (tools->empty()) {
        LOG_WARN("Server at {} advertises no tools", (*client)->describe());
        co_return false;
    }
    co_return true;
}

auto ConnectionCache::close_all() -> awaitable<void> {
    auto entries = std::exchange(entries_, {});
    if (entries.empty()) co_return;

    LOG_DEBUG("Closing {} cached connections", entries.size());
    size_t pending = entries.size();
    infra::AsyncEvent done(executor_);

    for (auto& [key, entry] : entries) {
        boost::asio::co_spawn(executor_,
            [entry, key, &pending, &done]() -> awaitable<void> {
                try {
                    // An entry still being created is closed once creation settles.
                    if (!entry->ready.is_set()) {
                        auto waited = co_await entry->ready.wait();
                        if (!waited) LOG_WARN("Gave up waiting on {}", key);
                    }
                    if (entry->client) co_await entry->client->close();
                } catch (const std::exception& e) {
                    LOG_ERROR("Error closing connection {}: {}", key, e.what());
                }
                if (--pending == 0) done.set();
            },
            boost::asio::detached);
    }

    auto finished = co_await done.wait();
    if (!finished) LOG_WARN("Connection teardown interrupted: {}", finished.error().what());
    LOG_INFO("All connections closed");
}

} // namespace mcpevals::mcp
