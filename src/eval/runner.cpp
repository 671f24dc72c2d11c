#include "mcpevals/eval/runner.hpp"
#include "mcpevals/core/logger.hpp"
#include "mcpevals/eval/orchestrator.hpp"
#include "mcpevals/eval/planner.hpp"
#include "mcpevals/eval/scorer.hpp"
#include "mcpevals/mcp/connection_cache.hpp"

#include <exception>

#include <boost/asio/this_coro.hpp>

namespace mcpevals::eval {

auto run_evaluation_suite(const EvaluationConfiguration& config, const RunOptions& options,
                          providers::Provider& provider, MetricsCollector* metrics,
                          const infra::CancelToken& cancel)
    -> boost::asio::awaitable<std::vector<EvaluationResult>> {
    auto executor = co_await boost::asio::this_coro::executor;

    mcp::ServerProcessManager processes(options.process);
    mcp::TransportCreationService transports(processes, options.transport);
    mcp::ConnectionCache connections(executor, transports, metrics);

    ToolPlanner planner(&provider, PlannerOptions{.model = config.model.name});
    ResponseScorer scorer(provider, ScorerOptions{
        .model = config.model.name,
        .temperature = config.model.temperature,
        .max_tokens = config.model.max_tokens,
    });
    EvaluationOrchestrator orchestrator(connections, planner, scorer, metrics,
                                        OrchestratorOptions{.parallelism = options.parallelism});

    std::vector<EvaluationResult> results;
    std::exception_ptr failure;
    try {
        results = co_await orchestrator.evaluate_all(config.evals, config.server, cancel);
    } catch (...) {
        // Rethrown below once the cache is closed.
        failure = std::current_exception();
    }

    co_await connections.close_all();
    if (failure) std::rethrow_exception(failure);
    co_return results;
}

auto check_connectivity(const ServerConfiguration& server, const RunOptions& options,
                        const infra::CancelToken& cancel) -> boost::asio::awaitable<bool> {
    auto executor = co_await boost::asio::this_coro::executor;

    mcp::ServerProcessManager processes(options.process);
    mcp::TransportCreationService transports(processes, options.transport);
    mcp::ConnectionCache connections(executor, transports);

    bool connected = false;
    std::exception_ptr failure;
    try {
        connected = co_await connections.test_connection(server, cancel);
    } catch (...) {
        failure = std::current_exception();
    }

    co_await connections.close_all();
    if (failure) std::rethrow_exception(failure);
    co_return connected;
}

} // namespace mcpevals::eval
