#include "mcpevals/eval/orchestrator.hpp"
#include "mcpevals/core/logger.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <thread>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>

namespace mcpevals::eval {

namespace {

auto elapsed_since(std::chrono::steady_clock::time_point started) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
}

auto default_parallelism() -> std::size_t {
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

} // anonymous namespace

auto summarize(const std::vector<EvaluationResult>& results) -> BatchSummary {
    BatchSummary summary;
    summary.total = results.size();
    double score_sum = 0.0;
    for (const auto& r : results) {
        if (r.is_success()) {
            ++summary.succeeded;
            score_sum += r.score.average_score();
        }
    }
    summary.failed = summary.total - summary.succeeded;
    if (summary.succeeded > 0) {
        summary.average_score = score_sum / static_cast<double>(summary.succeeded);
    }
    return summary;
}

EvaluationOrchestrator::EvaluationOrchestrator(mcp::ConnectionCache& connections,
                                               ToolPlanner& planner, ResponseScorer& scorer,
                                               MetricsCollector* metrics,
                                               OrchestratorOptions options)
    : connections_(connections)
    , planner_(planner)
    , scorer_(scorer)
    , metrics_(metrics)
    , parallelism_(options.parallelism == 0 ? default_parallelism() : options.parallelism) {}

auto EvaluationOrchestrator::run_request(const EvaluationRequest& request,
                                         const ServerConfiguration& server,
                                         const infra::CancelToken& cancel)
    -> awaitable<Result<EvaluationResult>> {
    auto started = std::chrono::steady_clock::now();

    bool connected = co_await connections_.test_connection(server, cancel);
    if (infra::is_cancelled(cancel)) co_return make_fail(infra::cancelled_error());
    if (!connected) {
        co_return make_fail(make_error(ErrorCode::ConnectionFailed,
                                       "Unable to connect to MCP server",
                                       server.path.empty() ? server.url : server.path));
    }

    auto client = co_await connections_.get_or_create_client(server, cancel);
    if (!client) co_return make_fail(client.error());

    LOG_DEBUG("Executing tool interaction for evaluation: {}", request.name);
    auto response = co_await planner_.execute(**client, request.prompt, cancel);
    if (!response) co_return make_fail(response.error());

    LOG_DEBUG("Scoring response for evaluation: {}", request.name);
    auto score = co_await scorer_.score(request.prompt, *response, request.expected_result, cancel);
    if (!score) co_return make_fail(score.error());

    co_return EvaluationResult{
        .name = request.name,
        .description = request.description,
        .prompt = request.prompt,
        .response = std::move(*response),
        .score = std::move(*score),
        .duration = elapsed_since(started),
    };
}

auto EvaluationOrchestrator::failure_result(const EvaluationRequest& request,
                                            const std::string& message,
                                            std::chrono::milliseconds duration)
    -> EvaluationResult {
    return EvaluationResult{
        .name = request.name,
        .description = request.description,
        .prompt = request.prompt,
        .response = std::string(),
        .score = EvaluationScore::failure_sentinel("Evaluation failed: " + message),
        .duration = duration,
        .error_message = message,
    };
}

auto EvaluationOrchestrator::evaluate(const EvaluationRequest& request,
                                      const ServerConfiguration& server,
                                      const infra::CancelToken& cancel)
    -> awaitable<EvaluationResult> {
    LOG_INFO("Starting evaluation: {}", request.name);
    auto started = std::chrono::steady_clock::now();
    if (metrics_) metrics_->evaluation_started(request.name);

    std::optional<Error> error;
    std::optional<EvaluationResult> result;
    try {
        auto outcome = co_await run_request(request, server, cancel);
        if (outcome) {
            result = std::move(*outcome);
        } else {
            error = outcome.error();
        }
    } catch (const std::exception& e) {
        error = make_error(ErrorCode::InternalError, e.what());
    }

    if (result) {
        if (metrics_) metrics_->evaluation_completed(request.name, result->duration, result->score);
        LOG_INFO("Evaluation completed successfully: {} (score: {:.2f})", request.name,
                 result->score.average_score());
        co_return std::move(*result);
    }

    auto message = error->what();
    if (metrics_) metrics_->evaluation_failed(request.name, *error);
    LOG_ERROR("Evaluation failed: {}: {}", request.name, message);
    co_return failure_result(request, message, elapsed_since(started));
}

auto EvaluationOrchestrator::evaluate_all(const std::vector<EvaluationRequest>& requests,
                                          const ServerConfiguration& server,
                                          const infra::CancelToken& cancel)
    -> awaitable<std::vector<EvaluationResult>> {
    LOG_INFO("Running {} evaluations (parallelism {})", requests.size(), parallelism_);
    if (requests.empty()) co_return std::vector<EvaluationResult>{};

    auto executor = co_await boost::asio::this_coro::executor;
    std::vector<std::optional<EvaluationResult>> slots(requests.size());
    std::size_t next = 0;
    std::size_t workers = std::min(parallelism_, requests.size());
    std::size_t running = workers;
    infra::AsyncEvent done(executor);

    // Each worker holds one slot of the parallelism budget for a whole
    // request and releases it by moving to the next index.
    for (std::size_t w = 0; w < workers; ++w) {
        boost::asio::co_spawn(executor,
            [&]() -> awaitable<void> {
                while (next < requests.size()) {
                    auto index = next++;
                    try {
                        slots[index] = co_await evaluate(requests[index], server, cancel);
                    } catch (const std::exception& e) {
                        LOG_ERROR("Evaluation worker error on {}: {}", requests[index].name,
                                  e.what());
                    }
                }
                if (--running == 0) done.set();
            },
            boost::asio::detached);
    }

    auto finished = co_await done.wait();
    if (!finished) LOG_WARN("Batch wait interrupted: {}", finished.error().what());

    std::vector<EvaluationResult> results;
    results.reserve(requests.size());
    for (std::size_t i = 0; i < requests.size(); ++i) {
        if (slots[i]) {
            results.push_back(std::move(*slots[i]));
        } else {
            results.push_back(failure_result(requests[i], "Evaluation did not complete",
                                             std::chrono::milliseconds(0)));
        }
    }

    auto summary = summarize(results);
    LOG_INFO("All evaluations completed. Success: {}, Failed: {}, Average Score: {:.2f}",
             summary.succeeded, summary.failed, summary.average_score);
    co_return results;
}

} // namespace mcpevals::eval
