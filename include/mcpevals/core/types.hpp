#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "mcpevals/core/error.hpp"

namespace mcpevals {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

/// Runtime needed to launch a server artifact.
enum class ServerType {
    TypeScriptScript,
    NodeScript,
    NativeExecutable,
    PythonScript,
    Unknown,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ServerType, {
    {ServerType::Unknown, "unknown"},
    {ServerType::TypeScriptScript, "typescript"},
    {ServerType::NodeScript, "node"},
    {ServerType::NativeExecutable, "native"},
    {ServerType::PythonScript, "python"},
})

auto server_type_to_string(ServerType type) -> std::string_view;

/// A planned or executed tool call. Argument values are strings, numbers,
/// booleans or null.
struct ToolExecution {
    std::string tool_name;
    json arguments = json::object();
};

void to_json(json& j, const ToolExecution& e);

struct EvaluationRequest {
    std::string name;
    std::string description;
    std::string prompt;
    std::optional<std::string> expected_result;
};

/// Five sub-scores in [1, 5] plus commentary. Only constructible through
/// create(), which rejects out-of-range values.
class EvaluationScore {
public:
    static constexpr int kMinScore = 1;
    static constexpr int kMaxScore = 5;

    static auto create(int accuracy, int completeness, int relevance,
                       int clarity, int reasoning, std::string comments)
        -> Result<EvaluationScore>;

    /// Mid-range score used when the scoring call produced nothing usable.
    static auto neutral(std::string comments) -> EvaluationScore;

    /// Minimum-valued marker attached to failed evaluations. Not a quality
    /// judgment.
    static auto failure_sentinel(std::string comments) -> EvaluationScore;

    [[nodiscard]] auto accuracy() const noexcept -> int { return accuracy_; }
    [[nodiscard]] auto completeness() const noexcept -> int { return completeness_; }
    [[nodiscard]] auto relevance() const noexcept -> int { return relevance_; }
    [[nodiscard]] auto clarity() const noexcept -> int { return clarity_; }
    [[nodiscard]] auto reasoning() const noexcept -> int { return reasoning_; }
    [[nodiscard]] auto comments() const noexcept -> const std::string& { return comments_; }

    [[nodiscard]] auto average_score() const noexcept -> double {
        return (accuracy_ + completeness_ + relevance_ + clarity_ + reasoning_) / 5.0;
    }

private:
    EvaluationScore(int accuracy, int completeness, int relevance,
                    int clarity, int reasoning, std::string comments)
        : accuracy_(accuracy), completeness_(completeness), relevance_(relevance)
        , clarity_(clarity), reasoning_(reasoning), comments_(std::move(comments)) {}

    int accuracy_;
    int completeness_;
    int relevance_;
    int clarity_;
    int reasoning_;
    std::string comments_;
};

void to_json(json& j, const EvaluationScore& s);

struct EvaluationResult {
    std::string name;
    std::string description;
    std::string prompt;
    std::string response;
    EvaluationScore score;
    std::chrono::milliseconds duration{0};
    std::optional<std::string> error_message;
    Timestamp timestamp = Clock::now();

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return !error_message.has_value() || error_message->empty();
    }
};

void to_json(json& j, const EvaluationResult& r);

} // namespace mcpevals
