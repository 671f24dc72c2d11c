#include "mcpevals/eval/metrics.hpp"
#include "mcpevals/core/logger.hpp"

#include <filesystem>

namespace mcpevals::eval {

namespace {

// Server paths are logged by file name only.
auto short_target(std::string_view target) -> std::string {
    auto name = std::filesystem::path(std::string(target)).filename().string();
    return name.empty() ? std::string(target) : name;
}

} // anonymous namespace

void LoggingMetricsCollector::evaluation_started(std::string_view name) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.evaluations_started;
    }
    LOG_INFO("metric: evaluation started - {}", name);
}

void LoggingMetricsCollector::evaluation_completed(std::string_view name,
                                                   std::chrono::milliseconds duration,
                                                   const EvaluationScore& score) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.evaluations_completed;
        counters_.total_evaluation_time += duration;
        counters_.score_sum += score.average_score();
    }
    LOG_INFO("metric: evaluation completed - {} | duration: {}ms | score: {:.2f}/5.0",
             name, duration.count(), score.average_score());
}

void LoggingMetricsCollector::evaluation_failed(std::string_view name, const Error& error) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.evaluations_failed;
    }
    LOG_WARN("metric: evaluation failed - {} | error: {}", name,
             error_code_to_string(error.code()));
}

void LoggingMetricsCollector::connection_attempt(std::string_view target) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.connection_attempts;
    }
    LOG_INFO("metric: connection attempt - {}", short_target(target));
}

void LoggingMetricsCollector::connection_succeeded(std::string_view target,
                                                   std::chrono::milliseconds duration) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.connection_successes;
    }
    LOG_INFO("metric: connection success - {} | duration: {}ms", short_target(target),
             duration.count());
}

void LoggingMetricsCollector::connection_failed(std::string_view target, const Error& error) {
    {
        std::lock_guard lock(mutex_);
        ++counters_.connection_failures;
    }
    LOG_WARN("metric: connection failure - {} | error: {}", short_target(target),
             error_code_to_string(error.code()));
}

auto LoggingMetricsCollector::snapshot() const -> MetricsSnapshot {
    std::lock_guard lock(mutex_);
    return counters_;
}

void LoggingMetricsCollector::log_summary() const {
    auto s = snapshot();
    LOG_INFO("metrics: evaluations started={} completed={} failed={} avg_score={:.2f} "
             "total_time={}ms",
             s.evaluations_started, s.evaluations_completed, s.evaluations_failed,
             s.average_score(), s.total_evaluation_time.count());
    LOG_INFO("metrics: connections attempted={} succeeded={} failed={}",
             s.connection_attempts, s.connection_successes, s.connection_failures);
}

} // namespace mcpevals::eval
