#pragma once

#include <cstddef>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "mcpevals/core/config.hpp"
#include "mcpevals/core/types.hpp"
#include "mcpevals/eval/metrics.hpp"
#include "mcpevals/infra/cancellation.hpp"
#include "mcpevals/mcp/process_manager.hpp"
#include "mcpevals/mcp/transport_factory.hpp"
#include "mcpevals/providers/provider.hpp"

namespace mcpevals::eval {

struct RunOptions {
    std::size_t parallelism = 0;
    mcp::ProcessManagerOptions process;
    mcp::TransportCreationOptions transport;
};

/// Runs every evaluation in `config` against its server. Owns the run's
/// connection cache and closes it on every exit path, including
/// cancellation and exceptions.
auto run_evaluation_suite(const EvaluationConfiguration& config, const RunOptions& options,
                          providers::Provider& provider, MetricsCollector* metrics,
                          const infra::CancelToken& cancel)
    -> boost::asio::awaitable<std::vector<EvaluationResult>>;

/// Connects to `server` and checks that it lists at least one tool. Any
/// server the check started is stopped before returning.
auto check_connectivity(const ServerConfiguration& server, const RunOptions& options,
                        const infra::CancelToken& cancel) -> boost::asio::awaitable<bool>;

} // namespace mcpevals::eval
