#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "mcpevals/core/error.hpp"
#include "mcpevals/core/types.hpp"
#include "mcpevals/infra/cancellation.hpp"
#include "mcpevals/providers/provider.hpp"

namespace mcpevals::eval {

struct ScorerOptions {
    std::string model;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
};

/// Grades a response with a second model call. A failed or unparseable
/// grading yields the neutral score rather than an error.
class ResponseScorer {
public:
    explicit ResponseScorer(providers::Provider& provider, ScorerOptions options = {});

    /// Fails only when cancelled.
    auto score(std::string_view prompt, std::string_view response,
               const std::optional<std::string>& expected_result,
               const infra::CancelToken& cancel) -> boost::asio::awaitable<Result<EvaluationScore>>;

    static auto system_prompt() -> std::string_view;

    static auto build_scoring_prompt(std::string_view prompt, std::string_view response,
                                     const std::optional<std::string>& expected_result)
        -> std::string;

    static auto parse_score(std::string_view raw) -> EvaluationScore;

private:
    providers::Provider& provider_;
    ScorerOptions options_;
};

} // namespace mcpevals::eval
