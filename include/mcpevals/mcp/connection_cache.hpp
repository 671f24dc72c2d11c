#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "mcpevals/core/config.hpp"
#include "mcpevals/core/error.hpp"
#include "mcpevals/eval/metrics.hpp"
#include "mcpevals/infra/cancellation.hpp"
#include "mcpevals/infra/sync.hpp"
#include "mcpevals/mcp/client.hpp"
#include "mcpevals/mcp/transport_factory.hpp"

namespace mcpevals::mcp {

/// Run-scoped cache of connected clients, one per configuration key. Lives on
/// a single io_context thread: lookup and insertion happen without a
/// suspension point in between, so concurrent callers for one key always
/// observe the same entry and exactly one of them creates the client.
///
/// The owner must call close_all() once the run is over.
class ConnectionCache {
public:
    ConnectionCache(boost::asio::any_io_executor executor, TransportFactory& factory,
                    eval::MetricsCollector* metrics = nullptr);
    ~ConnectionCache();

    ConnectionCache(const ConnectionCache&) = delete;
    ConnectionCache& operator=(const ConnectionCache&) = delete;

    /// "transport:path:url", plus ":a|b|c" when args are present. An empty
    /// transport is keyed as "stdio".
    static auto config_key(const ServerConfiguration& config) -> std::string;

    /// Returns the cached client for `config`, creating and connecting it on
    /// first use. A client whose server has exited is replaced once. Failed
    /// creations stay cached for the run; cancelled ones do not.
    auto get_or_create_client(const ServerConfiguration& config, const infra::CancelToken& cancel)
        -> awaitable<Result<std::shared_ptr<Client>>>;

    /// True when a client can be obtained and it lists at least one tool.
    auto test_connection(const ServerConfiguration& config, const infra::CancelToken& cancel)
        -> awaitable<bool>;

    /// Closes every cached client concurrently and empties the cache.
    /// Individual failures are logged. Safe to call repeatedly.
    auto close_all() -> awaitable<void>;

    [[nodiscard]] auto size() const noexcept -> size_t { return entries_.size(); }

    /// Number of transports this cache has asked the factory for.
    [[nodiscard]] auto creations() const noexcept -> size_t { return creations_; }

private:
    struct Entry {
        explicit Entry(const boost::asio::any_io_executor& executor) : ready(executor) {}
        infra::AsyncEvent ready;
        std::shared_ptr<Client> client;
        std::optional<Error> error;
    };

    auto populate(Entry& entry, const ServerConfiguration& config,
                  const infra::CancelToken& cancel) -> awaitable<void>;
    void erase_if_current(const std::string& key, const std::shared_ptr<Entry>& entry);

    boost::asio::any_io_executor executor_;
    TransportFactory& factory_;
    eval::MetricsCollector* metrics_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    size_t creations_ = 0;
};

} // namespace mcpevals::mcp
