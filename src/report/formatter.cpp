#include "mcpevals/report/formatter.hpp"
#include "mcpevals/core/utils.hpp"
#include "mcpevals/eval/orchestrator.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>

#include <spdlog/fmt/fmt.h>

namespace mcpevals::report {

namespace {

constexpr auto kDefaultComment = "No comments provided";

auto seconds(std::chrono::milliseconds ms) -> double {
    return static_cast<double>(ms.count()) / 1000.0;
}

auto success_rate(const eval::BatchSummary& s) -> double {
    return s.total == 0 ? 0.0 : 100.0 * static_cast<double>(s.succeeded) / static_cast<double>(s.total);
}

auto preview(std::string_view text, std::size_t limit) -> std::string {
    if (text.size() <= limit) return std::string(text);
    return utils::truncate(text, limit) + "...";
}

auto format_utc(Timestamp tp) -> std::string {
    auto t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

} // anonymous namespace

auto parse_report_format(std::string_view name) -> Result<ReportFormat> {
    auto lower = utils::to_lower(utils::trim(name));
    if (lower == "json") return ReportFormat::Json;
    if (lower == "summary") return ReportFormat::Summary;
    if (lower == "detailed") return ReportFormat::Detailed;
    if (lower == "clean") return ReportFormat::Clean;
    return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                      "Unsupported output format: " + std::string(name)));
}

auto report_format_to_string(ReportFormat format) -> std::string_view {
    switch (format) {
        case ReportFormat::Json: return "json";
        case ReportFormat::Summary: return "summary";
        case ReportFormat::Detailed: return "detailed";
        case ReportFormat::Clean: return "clean";
    }
    return "clean";
}

auto score_label(double average) -> std::string_view {
    if (average >= 4.5) return "Excellent";
    if (average >= 3.5) return "Good";
    if (average >= 2.5) return "Fair";
    if (average >= 1.5) return "Poor";
    return "Critical";
}

auto render_json(const std::vector<EvaluationResult>& results,
                 std::chrono::milliseconds total_duration, Timestamp generated_at) -> std::string {
    auto summary = eval::summarize(results);

    json items = json::array();
    for (const auto& r : results) {
        json item = r;
        item["responseLength"] = r.response.size();
        if (!r.is_success()) item["score"] = nullptr;
        items.push_back(std::move(item));
    }

    json doc = {
        {"summary", {
            {"totalEvaluations", summary.total},
            {"successfulEvaluations", summary.succeeded},
            {"failedEvaluations", summary.failed},
            {"averageScore", summary.average_score},
            {"totalDurationSeconds", seconds(total_duration)},
            {"timestamp", utils::format_iso(generated_at)},
        }},
        {"results", std::move(items)},
    };
    return doc.dump(2);
}

auto render_summary(const std::vector<EvaluationResult>& results,
                    std::chrono::milliseconds total_duration) -> std::string {
    auto summary = eval::summarize(results);

    std::string out = "MCP Evaluations Summary\n";
    out += "======================\n\n";
    out += fmt::format("Total Evaluations: {}\n", summary.total);
    out += fmt::format("Successful: {}\n", summary.succeeded);
    out += fmt::format("Failed: {}\n", summary.failed);
    out += fmt::format("Success Rate: {:.1f}%\n\n", success_rate(summary));
    out += fmt::format("Average Score: {:.2f}/5.0\n", summary.average_score);
    out += fmt::format("Total Duration: {:.1f} seconds\n\n", seconds(total_duration));

    if (summary.failed > 0) {
        out += "Failed Evaluations:\n";
        for (const auto& r : results) {
            if (!r.is_success()) {
                out += fmt::format("  [FAIL] {}: {}\n", r.name, r.error_message.value_or(""));
            }
        }
        out += "\n";
    }

    std::vector<const EvaluationResult*> successes;
    for (const auto& r : results) {
        if (r.is_success()) successes.push_back(&r);
    }
    std::ranges::stable_sort(successes, [](const auto* a, const auto* b) {
        return a->score.average_score() > b->score.average_score();
    });

    out += "Successful Evaluations:\n";
    for (const auto* r : successes) {
        out += fmt::format("  [PASS] {}: {:.2f}/5.0 ({:.1f}s)\n", r->name,
                           r->score.average_score(), seconds(r->duration));
    }
    return out;
}

auto render_detailed(const std::vector<EvaluationResult>& results,
                     std::chrono::milliseconds total_duration) -> std::string {
    auto out = render_summary(results, total_duration);
    out += "\n\nDetailed Results:\n";
    out += "================\n\n";

    for (const auto& r : results) {
        out += "Evaluation: " + r.name + "\n";
        out += "Description: " + r.description + "\n";
        out += std::string("Status: ") + (r.is_success() ? "Success" : "Failed") + "\n";
        out += fmt::format("Duration: {:.2f} seconds\n", seconds(r.duration));

        if (r.is_success()) {
            const auto& s = r.score;
            out += "Scores:\n";
            out += fmt::format("  Accuracy: {}/5\n", s.accuracy());
            out += fmt::format("  Completeness: {}/5\n", s.completeness());
            out += fmt::format("  Relevance: {}/5\n", s.relevance());
            out += fmt::format("  Clarity: {}/5\n", s.clarity());
            out += fmt::format("  Reasoning: {}/5\n", s.reasoning());
            out += fmt::format("  Average: {:.2f}/5\n", s.average_score());
            out += "Comments: " + s.comments() + "\n";
        } else {
            out += "Error: " + r.error_message.value_or("") + "\n";
        }

        out += "Prompt: " + preview(r.prompt, 100) + "\n";
        if (!r.response.empty()) out += "Response: " + preview(r.response, 200) + "\n";
        out += "\n" + std::string(50, '-') + "\n\n";
    }
    return out;
}

auto render_clean(const std::vector<EvaluationResult>& results,
                  std::chrono::milliseconds total_duration, Timestamp generated_at) -> std::string {
    auto summary = eval::summarize(results);

    std::string out = "# MCP Evaluation Results\n\n";
    out += "*Generated on " + format_utc(generated_at) + " UTC*\n\n";

    out += "## Summary\n\n";
    out += fmt::format("- **Total Evaluations:** {}\n", summary.total);
    out += fmt::format("- **Successful:** {} ✅\n", summary.succeeded);
    out += fmt::format("- **Failed:** {} ❌\n", summary.failed);
    out += fmt::format("- **Success Rate:** {:.1f}%\n", success_rate(summary));
    out += fmt::format("- **Average Score:** {:.2f}/5.0 {}\n", summary.average_score,
                       score_label(summary.average_score));
    out += fmt::format("- **Total Duration:** {:.1f} seconds\n\n", seconds(total_duration));

    out += "## Detailed Results\n\n";
    for (const auto& r : results) {
        if (r.is_success()) {
            const auto& s = r.score;
            out += "### ✅ " + r.name + "\n\n";
            out += fmt::format("**Score:** {:.1f}/5.0 {}  \n", s.average_score(),
                               score_label(s.average_score()));
            out += fmt::format("**Duration:** {:.1f}s  \n\n", seconds(r.duration));

            out += "| Metric | Score |\n";
            out += "|--------|-------|\n";
            out += fmt::format("| Accuracy | {}/5 |\n", s.accuracy());
            out += fmt::format("| Completeness | {}/5 |\n", s.completeness());
            out += fmt::format("| Relevance | {}/5 |\n", s.relevance());
            out += fmt::format("| Clarity | {}/5 |\n", s.clarity());
            out += fmt::format("| Reasoning | {}/5 |\n\n", s.reasoning());

            out += "**Test Prompt:**\n";
            out += "> " + r.prompt + "\n\n";

            if (!r.response.empty()) {
                out += "**Response:**\n";
                out += "```\n" + preview(r.response, 200) + "\n```\n\n";
            }

            if (!s.comments().empty() && s.comments() != kDefaultComment) {
                out += "**Evaluation Comments:**\n";
                out += "> " + s.comments() + "\n\n";
            }
        } else {
            out += "### ❌ " + r.name + "\n\n";
            out += "**Error:** " + r.error_message.value_or("") + "  \n";
            out += fmt::format("**Duration:** {:.1f}s  \n\n", seconds(r.duration));
        }
        out += "---\n\n";
    }
    return out;
}

auto format_report(const std::vector<EvaluationResult>& results, ReportFormat format,
                   std::chrono::milliseconds total_duration, Timestamp generated_at)
    -> std::string {
    switch (format) {
        case ReportFormat::Json: return render_json(results, total_duration, generated_at);
        case ReportFormat::Summary: return render_summary(results, total_duration);
        case ReportFormat::Detailed: return render_detailed(results, total_duration);
        case ReportFormat::Clean: return render_clean(results, total_duration, generated_at);
    }
    return render_clean(results, total_duration, generated_at);
}

auto clean_report_path(const std::filesystem::path& config_path) -> std::filesystem::path {
    auto dir = config_path.parent_path();
    if (dir.empty()) dir = std::filesystem::current_path();
    return dir / (config_path.stem().string() + ".md");
}

auto write_report(const std::filesystem::path& path, std::string_view content) -> VoidResult {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "Failed to open output file", path.string()));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "Failed to write output file", path.string()));
    }
    return {};
}

} // namespace mcpevals::report
