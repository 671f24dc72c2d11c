#pragma once

#include <cstddef>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "mcpevals/core/config.hpp"
#include "mcpevals/core/error.hpp"
#include "mcpevals/core/types.hpp"
#include "mcpevals/eval/metrics.hpp"
#include "mcpevals/eval/planner.hpp"
#include "mcpevals/eval/scorer.hpp"
#include "mcpevals/infra/cancellation.hpp"
#include "mcpevals/mcp/connection_cache.hpp"

namespace mcpevals::eval {

struct BatchSummary {
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    double average_score = 0.0;  // over successful results only
};

auto summarize(const std::vector<EvaluationResult>& results) -> BatchSummary;

struct OrchestratorOptions {
    /// Concurrent evaluations; 0 means one per hardware thread.
    std::size_t parallelism = 0;
};

/// Runs evaluation requests against one server: connectivity check, tool
/// planning and execution, then scoring. Every request yields a result; a
/// failure becomes a result with the sentinel score and the error message.
class EvaluationOrchestrator {
public:
    EvaluationOrchestrator(mcp::ConnectionCache& connections, ToolPlanner& planner,
                           ResponseScorer& scorer, MetricsCollector* metrics = nullptr,
                           OrchestratorOptions options = {});

    auto evaluate(const EvaluationRequest& request, const ServerConfiguration& server,
                  const infra::CancelToken& cancel) -> awaitable<EvaluationResult>;

    /// Results are returned in request order regardless of completion order.
    auto evaluate_all(const std::vector<EvaluationRequest>& requests,
                      const ServerConfiguration& server, const infra::CancelToken& cancel)
        -> awaitable<std::vector<EvaluationResult>>;

    [[nodiscard]] auto parallelism() const noexcept -> std::size_t { return parallelism_; }

private:
    auto run_request(const EvaluationRequest& request, const ServerConfiguration& server,
                     const infra::CancelToken& cancel) -> awaitable<Result<EvaluationResult>>;

    auto failure_result(const EvaluationRequest& request, const std::string& message,
                        std::chrono::milliseconds duration) -> EvaluationResult;

    mcp::ConnectionCache& connections_;
    ToolPlanner& planner_;
    ResponseScorer& scorer_;
    MetricsCollector* metrics_;
    std::size_t parallelism_;
};

} // namespace mcpevals::eval
