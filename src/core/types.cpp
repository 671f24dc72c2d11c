#include "mcpevals/core/types.hpp"
#include "mcpevals/core/utils.hpp"

namespace mcpevals {

auto server_type_to_string(ServerType type) -> std::string_view {
    switch (type) {
        case ServerType::TypeScriptScript: return "typescript";
        case ServerType::NodeScript: return "node";
        case ServerType::NativeExecutable: return "native";
        case ServerType::PythonScript: return "python";
        case ServerType::Unknown: return "unknown";
    }
    return "unknown";
}

void to_json(json& j, const ToolExecution& e) {
    j = json{{"toolName", e.tool_name}, {"arguments", e.arguments}};
}

auto EvaluationScore::create(int accuracy, int completeness, int relevance,
                             int clarity, int reasoning, std::string comments)
    -> Result<EvaluationScore> {
    const std::pair<const char*, int> parts[] = {
        {"accuracy", accuracy},
        {"completeness", completeness},
        {"relevance", relevance},
        {"clarity", clarity},
        {"reasoning", reasoning},
    };
    for (const auto& [label, value] : parts) {
        if (value < kMinScore || value > kMaxScore) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument,
                std::string(label) + " score must be between 1 and 5",
                "got " + std::to_string(value)));
        }
    }
    return EvaluationScore(accuracy, completeness, relevance, clarity, reasoning,
                           std::move(comments));
}

auto EvaluationScore::neutral(std::string comments) -> EvaluationScore {
    return EvaluationScore(3, 3, 3, 3, 3, std::move(comments));
}

auto EvaluationScore::failure_sentinel(std::string comments) -> EvaluationScore {
    return EvaluationScore(kMinScore, kMinScore, kMinScore, kMinScore, kMinScore,
                           std::move(comments));
}

void to_json(json& j, const EvaluationScore& s) {
    j = json{
        {"accuracy", s.accuracy()},
        {"completeness", s.completeness()},
        {"relevance", s.relevance()},
        {"clarity", s.clarity()},
        {"reasoning", s.reasoning()},
        {"averageScore", s.average_score()},
        {"overallComments", s.comments()},
    };
}

void to_json(json& j, const EvaluationResult& r) {
    j = json{
        {"name", r.name},
        {"description", r.description},
        {"prompt", r.prompt},
        {"response", r.response},
        {"score", r.score},
        {"durationMs", r.duration.count()},
        {"isSuccess", r.is_success()},
        {"timestamp", utils::format_iso(r.timestamp)},
    };
    if (r.error_message) j["errorMessage"] = *r.error_message;
}

} // namespace mcpevals
