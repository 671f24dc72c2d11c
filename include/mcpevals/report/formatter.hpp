#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "mcpevals/core/error.hpp"
#include "mcpevals/core/types.hpp"

namespace mcpevals::report {

enum class ReportFormat {
    Json,
    Summary,
    Detailed,
    Clean,  // Markdown
};

auto parse_report_format(std::string_view name) -> Result<ReportFormat>;
auto report_format_to_string(ReportFormat format) -> std::string_view;

/// Renders `results` in the requested format. `total_duration` is the wall
/// clock time of the whole run.
auto format_report(const std::vector<EvaluationResult>& results, ReportFormat format,
                   std::chrono::milliseconds total_duration,
                   Timestamp generated_at = Clock::now()) -> std::string;

auto render_json(const std::vector<EvaluationResult>& results,
                 std::chrono::milliseconds total_duration, Timestamp generated_at) -> std::string;
auto render_summary(const std::vector<EvaluationResult>& results,
                    std::chrono::milliseconds total_duration) -> std::string;
auto render_detailed(const std::vector<EvaluationResult>& results,
                     std::chrono::milliseconds total_duration) -> std::string;
auto render_clean(const std::vector<EvaluationResult>& results,
                  std::chrono::milliseconds total_duration, Timestamp generated_at) -> std::string;

/// Rating for an average score: Excellent, Good, Fair, Poor or Critical.
auto score_label(double average) -> std::string_view;

/// `<config stem>.md` in the config file's directory.
auto clean_report_path(const std::filesystem::path& config_path) -> std::filesystem::path;

auto write_report(const std::filesystem::path& path, std::string_view content) -> VoidResult;

} // namespace mcpevals::report
