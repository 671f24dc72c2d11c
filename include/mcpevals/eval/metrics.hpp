#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

#include "mcpevals/core/error.hpp"
#include "mcpevals/core/types.hpp"

namespace mcpevals::eval {

/// Receives evaluation and connection events. Implementations must tolerate
/// calls from any coroutine on the run's io_context.
class MetricsCollector {
public:
    virtual ~MetricsCollector() = default;

    virtual void evaluation_started(std::string_view name) = 0;
    virtual void evaluation_completed(std::string_view name, std::chrono::milliseconds duration,
                                      const EvaluationScore& score) = 0;
    virtual void evaluation_failed(std::string_view name, const Error& error) = 0;

    virtual void connection_attempt(std::string_view target) = 0;
    virtual void connection_succeeded(std::string_view target,
                                      std::chrono::milliseconds duration) = 0;
    virtual void connection_failed(std::string_view target, const Error& error) = 0;
};

struct MetricsSnapshot {
    uint64_t evaluations_started = 0;
    uint64_t evaluations_completed = 0;
    uint64_t evaluations_failed = 0;
    uint64_t connection_attempts = 0;
    uint64_t connection_successes = 0;
    uint64_t connection_failures = 0;
    std::chrono::milliseconds total_evaluation_time{0};
    double score_sum = 0.0;

    [[nodiscard]] auto average_score() const -> double {
        return evaluations_completed == 0 ? 0.0 : score_sum / static_cast<double>(evaluations_completed);
    }
};

/// Writes every event to the log and keeps running counters.
class LoggingMetricsCollector final : public MetricsCollector {
public:
    void evaluation_started(std::string_view name) override;
    void evaluation_completed(std::string_view name, std::chrono::milliseconds duration,
                              const EvaluationScore& score) override;
    void evaluation_failed(std::string_view name, const Error& error) override;

    void connection_attempt(std::string_view target) override;
    void connection_succeeded(std::string_view target,
                              std::chrono::milliseconds duration) override;
    void connection_failed(std::string_view target, const Error& error) override;

    [[nodiscard]] auto snapshot() const -> MetricsSnapshot;

    /// Logs the counters at info level.
    void log_summary() const;

private:
    mutable std::mutex mutex_;
    MetricsSnapshot counters_;
};

} // namespace mcpevals::eval
