#include "mcpevals/eval/planner.hpp"
#include "mcpevals/core/logger.hpp"
#include "mcpevals/core/utils.hpp"

#include <charconv>
#include <regex>
#include <set>

namespace mcpevals::eval {

namespace {

constexpr auto kNoToolsFound = "No appropriate tools were found for this request.";
constexpr auto kNoResponses = "No tool responses generated.";
constexpr auto kNoTextContent = "No text content";
constexpr auto kNoTextContentFound = "No text content found";
constexpr auto kUnableToExtract = "Unable to extract response content";

constexpr auto kPlanningRules = R"(Based on the user's prompt, determine which tools should be called and with what parameters.
Return a JSON object with a single tool execution in this format:
{
  "toolName": "tool_name",
  "arguments": { "param1": "value1", "param2": "value2" }
}

If no tools should be called, return: {}

Rules:
1. Only call tools that are directly relevant to the prompt
2. Use appropriate parameter values based on the prompt content
3. For mathematical operations (add, multiply), extract numbers from the prompt and use parameters 'a' and 'b'
4. For echo tools, use parameter 'message' with the text to echo
5. Be precise with parameter names and types - use 'a' and 'b' for math tools, 'message' for echo tools)";

auto is_placeholder(std::string_view text) -> bool {
    return text.empty() || text == kNoTextContent || text == kNoTextContentFound ||
           text == kUnableToExtract;
}

/// Plan argument values are scalars; nested structures are kept as raw JSON text.
auto normalize_arguments(const json& args) -> json {
    json out = json::object();
    if (!args.is_object()) return out;
    for (const auto& [key, value] : args.items()) {
        if (value.is_structured()) {
            out[key] = value.dump();
        } else {
            out[key] = value;
        }
    }
    return out;
}

auto to_execution(const json& item) -> std::optional<ToolExecution> {
    if (!item.is_object()) return std::nullopt;
    auto it = item.find("toolName");
    if (it == item.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return ToolExecution{
        .tool_name = it->get<std::string>(),
        .arguments = normalize_arguments(item.value("arguments", json::object())),
    };
}

/// Whitespace-separated words that parse completely as numbers once
/// surrounding punctuation is removed.
auto extract_numbers(std::string_view text) -> std::vector<json> {
    std::vector<json> numbers;
    for (const auto& word : utils::split(text, ' ')) {
        auto token = utils::trim_chars(word, ".,!?\t\r\n");
        if (token.empty()) continue;

        const char* first = token.data();
        const char* last = token.data() + token.size();
        if (token.find_first_of(".eE") == std::string::npos) {
            int64_t integer = 0;
            auto [ptr, ec] = std::from_chars(first, last, integer);
            if (ec == std::errc() && ptr == last) {
                numbers.emplace_back(integer);
                continue;
            }
        }
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc() && ptr == last) numbers.emplace_back(value);
    }
    return numbers;
}

auto description_matches(std::string_view prompt_lower, std::string_view description) -> bool {
    std::set<std::string> matched;
    for (const auto& word : utils::split(utils::to_lower(description), ' ')) {
        auto trimmed = utils::trim(word);
        if (trimmed.size() > 3 && prompt_lower.find(trimmed) != std::string_view::npos) {
            matched.insert(trimmed);
        }
    }
    return matched.size() >= 2;
}

} // anonymous namespace

auto plan_executions(const ToolPlan& plan) -> const std::vector<ToolExecution>& {
    return std::visit([](const auto& p) -> const std::vector<ToolExecution>& {
        return p.executions;
    }, plan);
}

auto is_fallback(const ToolPlan& plan) -> bool {
    return std::holds_alternative<FallbackPlan>(plan);
}

ToolPlanner::ToolPlanner(providers::Provider* provider, PlannerOptions options)
    : provider_(provider)
    , options_(std::move(options)) {}

auto ToolPlanner::build_planning_prompt(const std::vector<mcp::Tool>& tools) -> std::string {
    std::string prompt =
        "You are an AI assistant that determines which tools to call based on user prompts.\n\n"
        "Available tools:\n";
    for (const auto& tool : tools) {
        prompt += "- " + tool.name + ": " +
                  (tool.description.empty() ? std::string("No description available")
                                            : tool.description) +
                  "\n";
    }
    prompt += "\n";
    prompt += kPlanningRules;
    return prompt;
}

auto ToolPlanner::parse_plan_response(std::string_view text) -> std::vector<ToolExecution> {
    auto doc = json::parse(utils::strip_code_fences(text), nullptr, false);
    std::vector<ToolExecution> executions;
    if (doc.is_discarded()) return executions;

    auto collect = [&](const json& items) {
        for (const auto& item : items) {
            if (auto execution = to_execution(item)) executions.push_back(std::move(*execution));
        }
    };

    if (doc.is_array()) {
        collect(doc);
    } else if (doc.is_object()) {
        if (doc.contains("tools") && doc["tools"].is_array()) {
            collect(doc["tools"]);
        } else if (auto execution = to_execution(doc)) {
            executions.push_back(std::move(*execution));
        }
    }
    return executions;
}

auto ToolPlanner::extract_arguments(std::string_view prompt) -> json {
    json args = json::object();

    auto numbers = extract_numbers(prompt);
    if (numbers.size() >= 2) {
        args["a"] = numbers[0];
        args["b"] = numbers[1];
    } else if (numbers.size() == 1) {
        args["value"] = numbers[0];
        args["number"] = numbers[0];
    }

    static const std::regex quoted(R"(['"]([^'"]*)['"])");
    std::string text(prompt);
    std::smatch m;
    std::string message = std::regex_search(text, m, quoted) ? m[1].str() : text;
    args["message"] = message;
    args["text"] = message;
    args["input"] = message;
    return args;
}

auto ToolPlanner::plan_with_pattern_matching(std::string_view prompt,
                                             const std::vector<mcp::Tool>& tools)
    -> std::vector<ToolExecution> {
    auto prompt_lower = utils::to_lower(prompt);

    for (const auto& tool : tools) {
        auto name_lower = utils::to_lower(tool.name);
        bool named = !name_lower.empty() && prompt_lower.find(name_lower) != std::string::npos;
        if (named || description_matches(prompt_lower, tool.description)) {
            return {ToolExecution{.tool_name = tool.name, .arguments = extract_arguments(prompt)}};
        }
    }
    return {};
}

auto ToolPlanner::plan(std::string_view prompt, const std::vector<mcp::Tool>& tools,
                       const infra::CancelToken& cancel) -> awaitable<Result<ToolPlan>> {
    auto cause = make_error(ErrorCode::PlanningFailed, "No language model configured");

    if (provider_ != nullptr) {
        auto response = co_await provider_->generate(
            build_planning_prompt(tools), "User prompt: " + std::string(prompt),
            providers::GenerateOptions{
                .model = options_.model,
                .temperature = options_.temperature,
                .max_tokens = options_.max_tokens,
                .json_output = true,
            },
            cancel);

        if (response) {
            auto executions = parse_plan_response(*response);
            if (!executions.empty()) {
                LOG_DEBUG("Model planned {} tool executions", executions.size());
                co_return ToolPlan{LlmPlan{std::move(executions)}};
            }
            cause = make_error(ErrorCode::PlanningFailed, "Model planned no tool executions");
            LOG_DEBUG("Unusable plan from model: {}", utils::truncate(*response, 200));
        } else if (response.error().code() == ErrorCode::Cancelled) {
            co_return make_fail(response.error());
        } else {
            cause = make_error(ErrorCode::PlanningFailed, "Planning call failed",
                               response.error().what());
            LOG_WARN("[{}] {}, falling back to pattern matching",
                     error_code_to_string(cause.code()), cause.what());
        }
    }

    auto executions = plan_with_pattern_matching(prompt, tools);
    LOG_DEBUG("Pattern matching planned {} tool executions", executions.size());
    co_return ToolPlan{FallbackPlan{std::move(executions), std::move(cause)}};
}

auto ToolPlanner::extract_text(const mcp::ToolCallResult& result) -> std::string {
    const auto& content = result.content;
    if (!content.is_array() || content.empty()) {
        if (result.structured_content) return result.structured_content->dump();
        return kNoTextContent;
    }

    for (const auto& block : content) {
        if (block.is_object() && block.value("type", "") == "text") {
            auto it = block.find("text");
            if (it == block.end() || !it->is_string()) return kNoTextContent;
            return it->get<std::string>();
        }
    }
    return content.dump();
}

auto ToolPlanner::execute(mcp::Client& client, std::string_view prompt,
                          const infra::CancelToken& cancel) -> awaitable<Result<std::string>> {
    auto tools = co_await client.list_tools(cancel);
    if (!tools) co_return make_fail(tools.error());

    for (const auto& tool : *tools) {
        LOG_DEBUG("  - {}: {}", tool.name, tool.description);
    }

    auto plan_result = co_await plan(prompt, *tools, cancel);
    if (!plan_result) co_return make_fail(plan_result.error());
    const auto& executions = plan_executions(*plan_result);

    std::vector<std::string> lines;
    for (const auto& execution : executions) {
        LOG_DEBUG("Calling tool {} with arguments: {}", execution.tool_name,
                  execution.arguments.dump());

        auto result = co_await client.call_tool(execution.tool_name, execution.arguments, cancel);
        if (!result) {
            if (result.error().code() == ErrorCode::Cancelled) co_return make_fail(result.error());
            LOG_WARN("Failed to call tool {}: {}", execution.tool_name, result.error().what());
            lines.push_back("Error calling tool " + execution.tool_name + ": " +
                            result.error().what());
            continue;
        }

        auto text = extract_text(*result);
        if (result->is_error) {
            LOG_WARN("Tool {} reported an error: {}", execution.tool_name, text);
            lines.push_back("Error calling tool " + execution.tool_name + ": " + text);
            continue;
        }
        if (!is_placeholder(text)) lines.push_back(std::move(text));
    }

    if (executions.empty()) lines.emplace_back(kNoToolsFound);

    if (lines.empty()) co_return std::string(kNoResponses);
    co_return utils::join(lines, "\n");
}

} // namespace mcpevals::eval
