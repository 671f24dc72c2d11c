#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "mcpevals/core/error.hpp"
#include "mcpevals/core/types.hpp"
#include "mcpevals/infra/cancellation.hpp"
#include "mcpevals/mcp/client.hpp"
#include "mcpevals/mcp/protocol.hpp"
#include "mcpevals/providers/provider.hpp"

namespace mcpevals::eval {

using boost::asio::awaitable;

/// Plan chosen by the language model.
struct LlmPlan {
    std::vector<ToolExecution> executions;
};

/// Plan produced by keyword matching after the model call failed or chose
/// nothing usable. `cause` carries ErrorCode::PlanningFailed.
struct FallbackPlan {
    std::vector<ToolExecution> executions;
    Error cause;
};

using ToolPlan = std::variant<LlmPlan, FallbackPlan>;

[[nodiscard]] auto plan_executions(const ToolPlan& plan) -> const std::vector<ToolExecution>&;
[[nodiscard]] auto is_fallback(const ToolPlan& plan) -> bool;

struct PlannerOptions {
    std::string model;
    double temperature = 0.1;
    int max_tokens = 500;
};

/// Decides which tools a prompt calls for and runs them.
class ToolPlanner {
public:
    /// A null provider always plans by pattern matching.
    explicit ToolPlanner(providers::Provider* provider, PlannerOptions options = {});

    /// Asks the model for a plan, falling back to pattern matching when the
    /// call fails or yields no executions. Fails only when cancelled.
    auto plan(std::string_view prompt, const std::vector<mcp::Tool>& tools,
              const infra::CancelToken& cancel) -> awaitable<Result<ToolPlan>>;

    /// Lists tools, plans, calls each planned tool and joins the text of the
    /// results. A failing tool adds an error line; the remaining tools still run.
    auto execute(mcp::Client& client, std::string_view prompt, const infra::CancelToken& cancel)
        -> awaitable<Result<std::string>>;

    static auto build_planning_prompt(const std::vector<mcp::Tool>& tools) -> std::string;

    /// Accepts {toolName, arguments}, {"tools": [...]} or a bare array.
    /// Anything unusable yields an empty list.
    static auto parse_plan_response(std::string_view text) -> std::vector<ToolExecution>;

    static auto plan_with_pattern_matching(std::string_view prompt,
                                           const std::vector<mcp::Tool>& tools)
        -> std::vector<ToolExecution>;

    /// Numbers become a/b (or value/number when there is only one); the first
    /// quoted substring, else the whole prompt, becomes message/text/input.
    static auto extract_arguments(std::string_view prompt) -> nlohmann::json;

    /// Text of the first text block, or the serialized content. Empty results
    /// yield a placeholder that execute() discards.
    static auto extract_text(const mcp::ToolCallResult& result) -> std::string;

private:
    providers::Provider* provider_;
    PlannerOptions options_;
};

} // namespace mcpevals::eval
