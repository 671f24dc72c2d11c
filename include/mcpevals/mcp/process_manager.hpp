#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "mcpevals/core/config.hpp"
#include "mcpevals/core/error.hpp"
#include "mcpevals/core/types.hpp"
#include "mcpevals/infra/cancellation.hpp"
#include "mcpevals/infra/child_process.hpp"

namespace mcpevals::mcp {

using boost::asio::awaitable;

struct ReadinessPolicy {
    std::chrono::milliseconds interval{std::chrono::seconds(2)};
    int max_attempts = 15;
    std::chrono::seconds probe_timeout{2};
};

struct ProcessManagerOptions {
    /// How long a fresh process must survive before it counts as started.
    std::chrono::milliseconds settle_delay{std::chrono::seconds(1)};
    ReadinessPolicy readiness;
};

/// One readiness attempt against `endpoint`; true when the server answered.
using ReadinessProbe = std::function<awaitable<bool>(const std::string& endpoint,
                                                     const infra::CancelToken& cancel)>;

/// Launches server processes for HTTP-served artifacts and waits for them to
/// accept requests.
class ServerProcessManager {
public:
    explicit ServerProcessManager(ProcessManagerOptions options = {},
                                  ReadinessProbe probe = {});

    /// Launches the artifact at `path` with the runtime for `type`. Fails with
    /// ServerStartFailed when the process exits within the settle delay.
    auto start_server(ServerType type, const std::filesystem::path& path,
                      const ServerConfiguration& config, const infra::CancelToken& cancel)
        -> awaitable<Result<std::unique_ptr<infra::ChildProcess>>>;

    /// Probes `endpoint` until it answers, the attempt ceiling is reached,
    /// `budget` runs out, or `cancel` fires.
    auto is_server_ready(const std::string& endpoint, const infra::CancelToken& cancel,
                         std::optional<std::chrono::milliseconds> budget = std::nullopt)
        -> awaitable<bool>;

    [[nodiscard]] auto options() const -> const ProcessManagerOptions& { return options_; }

    /// POSTs {"jsonrpc":"2.0","method":"ping","id":1}; any HTTP response counts.
    static auto http_ping_probe(std::chrono::seconds timeout) -> ReadinessProbe;

private:
    ProcessManagerOptions options_;
    ReadinessProbe probe_;
};

} // namespace mcpevals::mcp
