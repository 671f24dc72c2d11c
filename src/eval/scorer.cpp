#include "mcpevals/eval/scorer.hpp"
#include "mcpevals/core/logger.hpp"
#include "mcpevals/core/utils.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>

namespace mcpevals::eval {

namespace {

constexpr auto kSystemPrompt = R"(You are an expert evaluator assessing how well an LLM answers a given question.
Review the provided answer and score it from 1 to 5 in each of the following categories:

Accuracy - Does the answer contain factual errors or hallucinations?
Completeness - Does the answer fully address all parts of the question?
Relevance - Is the information directly related to the question?
Clarity - Is the explanation easy to understand and well-structured?
Reasoning - Does the answer show logical thinking or provide evidence or rationale?

Return your evaluation as a JSON object in the exact format:
{
    "accuracy": 1-5,
    "completeness": 1-5,
    "relevance": 1-5,
    "clarity": 1-5,
    "reasoning": 1-5,
    "overall_comments": "A short paragraph summarizing the strengths and weaknesses of the answer."
}

Important: Return ONLY the JSON object, no additional text or formatting.)";

constexpr auto kNoComments = "No comments provided";
constexpr std::size_t kRawExcerptLength = 200;

/// Keys lower-cased with underscores removed, so "overall_comments" and
/// "overallComments" meet.
auto normalize_key(std::string_view key) -> std::string {
    std::string out;
    for (char c : utils::to_lower(key)) {
        if (c != '_') out += c;
    }
    return out;
}

/// Sub-scores outside the range of int are treated as unreadable.
auto read_score(const json& value) -> std::optional<int> {
    constexpr auto kMin = std::numeric_limits<int>::min();
    constexpr auto kMax = std::numeric_limits<int>::max();

    if (value.is_number_unsigned()) {
        auto v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(kMax)) return std::nullopt;
        return static_cast<int>(v);
    }
    if (value.is_number_integer()) {
        auto v = value.get<std::int64_t>();
        if (v < kMin || v > kMax) return std::nullopt;
        return static_cast<int>(v);
    }
    if (value.is_number()) {
        auto v = value.get<double>();
        if (!std::isfinite(v) || v < kMin || v > kMax) return std::nullopt;
        return static_cast<int>(std::lround(v));
    }
    if (value.is_string()) {
        auto text = utils::trim(value.get<std::string>());
        try {
            std::size_t used = 0;
            int parsed = std::stoi(text, &used);
            if (used == text.size()) return parsed;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

auto outermost_object(std::string_view text) -> std::string {
    auto cleaned = utils::strip_code_fences(text);
    auto start = cleaned.find('{');
    auto end = cleaned.rfind('}');
    if (start != std::string::npos && end != std::string::npos && end > start) {
        return cleaned.substr(start, end - start + 1);
    }
    return cleaned;
}

auto parse_failure(std::string_view raw) -> EvaluationScore {
    return EvaluationScore::neutral("Failed to parse evaluation result. Raw result: " +
                                    utils::truncate(raw, kRawExcerptLength));
}

} // anonymous namespace

ResponseScorer::ResponseScorer(providers::Provider& provider, ScorerOptions options)
    : provider_(provider)
    , options_(std::move(options)) {}

auto ResponseScorer::system_prompt() -> std::string_view {
    return kSystemPrompt;
}

auto ResponseScorer::build_scoring_prompt(std::string_view prompt, std::string_view response,
                                          const std::optional<std::string>& expected_result)
    -> std::string {
    std::string text = "Here is the user input: " + std::string(prompt) +
                       "\nHere is the LLM's answer: " + std::string(response);
    if (expected_result && !expected_result->empty()) {
        text += "\nExpected result for reference: " + *expected_result;
    }
    return text;
}

auto ResponseScorer::parse_score(std::string_view raw) -> EvaluationScore {
    auto doc = json::parse(outermost_object(raw), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        LOG_WARN("Failed to parse evaluation result, using fallback scoring");
        return parse_failure(raw);
    }

    std::map<std::string, json> fields;
    for (const auto& [key, value] : doc.items()) fields[normalize_key(key)] = value;

    auto score_of = [&](const char* key) -> std::optional<int> {
        auto it = fields.find(key);
        return it == fields.end() ? std::nullopt : read_score(it->second);
    };

    auto accuracy = score_of("accuracy");
    auto completeness = score_of("completeness");
    auto relevance = score_of("relevance");
    auto clarity = score_of("clarity");
    auto reasoning = score_of("reasoning");
    if (!accuracy || !completeness || !relevance || !clarity || !reasoning) {
        LOG_WARN("Evaluation result is missing sub-scores, using fallback scoring");
        return parse_failure(raw);
    }

    std::string comments = kNoComments;
    if (auto it = fields.find("overallcomments");
        it != fields.end() && it->second.is_string() && !it->second.get<std::string>().empty()) {
        comments = it->second.get<std::string>();
    }

    auto score = EvaluationScore::create(*accuracy, *completeness, *relevance, *clarity,
                                         *reasoning, std::move(comments));
    if (!score) {
        LOG_WARN("Evaluation result rejected: {}", score.error().what());
        return parse_failure(raw);
    }
    return std::move(*score);
}

auto ResponseScorer::score(std::string_view prompt, std::string_view response,
                           const std::optional<std::string>& expected_result,
                           const infra::CancelToken& cancel)
    -> boost::asio::awaitable<Result<EvaluationScore>> {
    LOG_DEBUG("Scoring response for prompt of length {}", prompt.size());

    auto raw = co_await provider_.generate(
        std::string(kSystemPrompt), build_scoring_prompt(prompt, response, expected_result),
        providers::GenerateOptions{
            .model = options_.model,
            .temperature = options_.temperature,
            .max_tokens = options_.max_tokens,
        },
        cancel);

    if (!raw) {
        if (raw.error().code() == ErrorCode::Cancelled) co_return make_fail(raw.error());
        auto failure = make_error(ErrorCode::ScoringFailed, "Scoring failed", raw.error().what());
        LOG_WARN("[{}] {}", error_code_to_string(failure.code()), failure.what());
        co_return EvaluationScore::neutral(failure.what());
    }

    auto score = parse_score(*raw);
    LOG_DEBUG("Scoring completed with average score {:.2f}", score.average_score());
    co_return score;
}

} // namespace mcpevals::eval
