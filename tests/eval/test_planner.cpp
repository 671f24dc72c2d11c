#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <memory>

#include <utility>
#include <boost/asio.hpp>

#include "mcpevals/eval/planner.hpp"
#include "mcpevals/mcp/client.hpp"
#include "../support/fakes.hpp"
#include "../support/run_sync.hpp"

using namespace mcpevals;
using namespace mcpevals::eval;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using mcpevals::testing::FakeTransport;
using mcpevals::testing::FakeTransportState;
using mcpevals::testing::ScriptedProvider;
using mcpevals::testing::run_sync;

namespace {

auto calculator_tools() -> std::vector<mcp::Tool> {
    std::vector<mcp::Tool> tools(3);
    tools[0].name = "add";
    tools[0].description = "Add two numbers together";
    tools[1].name = "echo";
    tools[1].description = "Echo back the provided message";
    tools[2].name = "get_conditions";
    tools[2].description = "Weather forecast for a city";
    return tools;
}

auto connected_client(boost::asio::io_context& ioc, std::shared_ptr<FakeTransportState> state)
    -> std::unique_ptr<mcp::Client> {
    auto client = std::make_unique<mcp::Client>(ioc.get_executor(),
                                                std::make_unique<FakeTransport>(std::move(state)));
    auto connected = run_sync(ioc, client->connect(nullptr));
    REQUIRE(connected.has_value());
    return client;
}

auto reply(std::string text) -> ScriptedProvider::Script {
    return [text = std::move(text)](const providers::CompletionRequest&) -> Result<std::string> {
        return text;
    };
}

} // anonymous namespace

TEST_CASE("Planning prompt lists every tool", "[eval][planner]") {
    auto tools = calculator_tools();
    tools[1].description.clear();
    auto prompt = ToolPlanner::build_planning_prompt(tools);

    CHECK_THAT(prompt, ContainsSubstring("- add: Add two numbers together\n"));
    CHECK_THAT(prompt, ContainsSubstring("- echo: No description available\n"));
    CHECK_THAT(prompt, ContainsSubstring("use 'a' and 'b' for math tools"));
}

TEST_CASE("Plan responses in several shapes", "[eval][planner]") {
    SECTION("single object") {
        auto plan = ToolPlanner::parse_plan_response(
            R"({"toolName": "add", "arguments": {"a": 5, "b": 3}})");
        REQUIRE(plan.size() == 1);
        CHECK(plan[0].tool_name == "add");
        CHECK(plan[0].arguments["a"] == 5);
        CHECK(plan[0].arguments["b"] == 3);
    }

    SECTION("tools array") {
        auto plan = ToolPlanner::parse_plan_response(
            R"({"tools": [{"toolName": "add", "arguments": {}}, {"toolName": "echo"}]})");
        REQUIRE(plan.size() == 2);
        CHECK(plan[1].tool_name == "echo");
        CHECK(plan[1].arguments.empty());
    }

    SECTION("bare array skips entries without a name") {
        auto plan = ToolPlanner::parse_plan_response(
            R"([{"toolName": "echo", "arguments": {"message": "hi"}}, {"arguments": {}}])");
        REQUIRE(plan.size() == 1);
        CHECK(plan[0].arguments["message"] == "hi");
    }

    SECTION("fenced reply") {
        auto plan = ToolPlanner::parse_plan_response(
            "```json\n{\"toolName\": \"echo\", \"arguments\": {\"message\": \"x\"}}\n```");
        REQUIRE(plan.size() == 1);
        CHECK(plan[0].tool_name == "echo");
    }

    SECTION("nested argument values become JSON text") {
        auto plan = ToolPlanner::parse_plan_response(
            R"({"toolName": "echo", "arguments": {"payload": {"k": 1}}})");
        REQUIRE(plan.size() == 1);
        CHECK(plan[0].arguments["payload"] == R"({"k":1})");
    }

    SECTION("nothing usable") {
        CHECK(ToolPlanner::parse_plan_response("{}").empty());
        CHECK(ToolPlanner::parse_plan_response("I would call the add tool").empty());
        CHECK(ToolPlanner::parse_plan_response(R"({"toolName": ""})").empty());
    }
}

TEST_CASE("Argument extraction from prompts", "[eval][planner]") {
    SECTION("two numbers") {
        auto args = ToolPlanner::extract_arguments("add 5 and 3");
        CHECK(args["a"] == 5);
        CHECK(args["b"] == 3);
        CHECK(args["a"].is_number_integer());
        CHECK_FALSE(args.contains("value"));
        CHECK(args["message"] == "add 5 and 3");
    }

    SECTION("decimals and punctuation") {
        auto args = ToolPlanner::extract_arguments("Multiply 2.5 by 4.");
        CHECK(args["a"] == 2.5);
        CHECK(args["b"] == 4);
    }

    SECTION("one number") {
        auto args = ToolPlanner::extract_arguments("square root of 16");
        CHECK(args["value"] == 16);
        CHECK(args["number"] == 16);
        CHECK_FALSE(args.contains("a"));
    }

    SECTION("quoted text") {
        auto args = ToolPlanner::extract_arguments("echo 'hello world' back to me");
        CHECK(args["message"] == "hello world");
        CHECK(args["text"] == "hello world");
        CHECK(args["input"] == "hello world");
    }
}

TEST_CASE("Pattern matching picks a tool", "[eval][planner]") {
    auto tools = calculator_tools();

    SECTION("by name") {
        auto plan = ToolPlanner::plan_with_pattern_matching("Please ADD 1 and 2", tools);
        REQUIRE(plan.size() == 1);
        CHECK(plan[0].tool_name == "add");
        CHECK(plan[0].arguments["a"] == 1);
    }

    SECTION("by two description words") {
        auto plan = ToolPlanner::plan_with_pattern_matching(
            "What is the weather forecast in Oslo?", tools);
        REQUIRE(plan.size() == 1);
        CHECK(plan[0].tool_name == "get_conditions");
    }

    SECTION("one description word is not enough") {
        CHECK(ToolPlanner::plan_with_pattern_matching("Is it sunny? Check the weather", tools)
                  .empty());
    }
}

TEST_CASE("plan prefers the model and falls back on failure", "[eval][planner]") {
    boost::asio::io_context ioc;
    auto tools = calculator_tools();

    SECTION("model plan") {
        ScriptedProvider provider(reply(R"({"toolName": "echo", "arguments": {"message": "m"}})"));
        ToolPlanner planner(&provider, PlannerOptions{.model = "planner-model"});
        auto plan = run_sync(ioc, planner.plan("say m", tools, nullptr));
        REQUIRE(plan.has_value());
        CHECK_FALSE(is_fallback(*plan));
        REQUIRE(plan_executions(*plan).size() == 1);

        REQUIRE(provider.requests.size() == 1);
        const auto& req = provider.requests[0];
        CHECK(req.json_output);
        CHECK(req.model == "planner-model");
        CHECK(req.max_tokens == 500);
        CHECK(req.messages[0].content == "User prompt: say m");
    }

    SECTION("model failure") {
        ScriptedProvider provider(mcpevals::testing::unavailable_model());
        ToolPlanner planner(&provider);
        auto plan = run_sync(ioc, planner.plan("add 2 and 2", tools, nullptr));
        REQUIRE(plan.has_value());
        REQUIRE(is_fallback(*plan));
        const auto& cause = std::get<FallbackPlan>(*plan).cause;
        CHECK(cause.code() == ErrorCode::PlanningFailed);
        CHECK(cause.what() == "Planning call failed: model unavailable");
        CHECK(plan_executions(*plan)[0].tool_name == "add");
    }

    SECTION("model failure plans add with both operands") {
        ScriptedProvider provider(mcpevals::testing::unavailable_model());
        ToolPlanner planner(&provider);
        auto plan = run_sync(ioc, planner.plan("add 5 and 3", tools, nullptr));
        REQUIRE(plan.has_value());
        REQUIRE(is_fallback(*plan));
        const auto& executions = plan_executions(*plan);
        REQUIRE(executions.size() == 1);
        CHECK(executions[0].tool_name == "add");
        CHECK(executions[0].arguments["a"] == 5);
        CHECK(executions[0].arguments["b"] == 3);
    }

    SECTION("empty model plan") {
        ScriptedProvider provider(reply("{}"));
        ToolPlanner planner(&provider);
        auto plan = run_sync(ioc, planner.plan("echo 'x'", tools, nullptr));
        REQUIRE(plan.has_value());
        CHECK(is_fallback(*plan));
        CHECK(std::get<FallbackPlan>(*plan).cause.code() == ErrorCode::PlanningFailed);
        CHECK(std::get<FallbackPlan>(*plan).cause.message() == "Model planned no tool executions");
    }

    SECTION("no provider") {
        ToolPlanner planner(nullptr);
        auto plan = run_sync(ioc, planner.plan("nothing relevant", tools, nullptr));
        REQUIRE(plan.has_value());
        CHECK(is_fallback(*plan));
        CHECK(std::get<FallbackPlan>(*plan).cause.message() == "No language model configured");
        CHECK(plan_executions(*plan).empty());
    }

    SECTION("cancelled") {
        ScriptedProvider provider(reply("{}"));
        ToolPlanner planner(&provider);
        auto cancel = infra::CancellationSignal::create();
        cancel->cancel();
        auto plan = run_sync(ioc, planner.plan("add 1 and 2", tools, cancel));
        REQUIRE_FALSE(plan.has_value());
        CHECK(plan.error().code() == ErrorCode::Cancelled);
    }
}

TEST_CASE("extract_text reads tool results", "[eval][planner]") {
    mcp::ToolCallResult result;
    result.content = json::array({{{"type", "image"}, {"data", "..."}},
                                  {{"type", "text"}, {"text", "42"}}});
    CHECK(ToolPlanner::extract_text(result) == "42");

    result.content = json::array();
    CHECK(ToolPlanner::extract_text(result) == "No text content");

    result.content = json::array({{{"type", "resource"}, {"uri", "file:///a"}}});
    CHECK(ToolPlanner::extract_text(result) == result.content.dump());
}

TEST_CASE("execute runs the planned tools", "[eval][planner]") {
    boost::asio::io_context ioc;
    auto state = std::make_shared<FakeTransportState>();
    auto client = connected_client(ioc, state);

    SECTION("model-planned add") {
        ScriptedProvider provider(reply(R"({"toolName": "add", "arguments": {"a": 5, "b": 3}})"));
        ToolPlanner planner(&provider);
        auto text = run_sync(ioc, planner.execute(*client, "What is 5 plus 3?", nullptr));
        REQUIRE(text.has_value());
        CHECK(*text == "8");
    }

    SECTION("a failing tool leaves an error line and the rest still run") {
        ScriptedProvider provider(reply(
            R"({"tools": [{"toolName": "broken"}, {"toolName": "echo", "arguments": {"message": "after"}}]})"));
        ToolPlanner planner(&provider);
        auto text = run_sync(ioc, planner.execute(*client, "do both", nullptr));
        REQUIRE(text.has_value());
        CHECK_THAT(*text, StartsWith("Error calling tool broken: "));
        CHECK_THAT(*text, ContainsSubstring("exploded"));
        CHECK_THAT(*text, ContainsSubstring("\nafter"));
    }

    SECTION("no matching tool") {
        ToolPlanner planner(nullptr);
        auto text = run_sync(ioc, planner.execute(*client, "tell me a joke", nullptr));
        REQUIRE(text.has_value());
        CHECK(*text == "No appropriate tools were found for this request.");
    }

    SECTION("placeholder output is dropped") {
        ScriptedProvider provider(reply(R"({"toolName": "echo", "arguments": {}})"));
        ToolPlanner planner(&provider);
        auto text = run_sync(ioc, planner.execute(*client, "echo nothing", nullptr));
        REQUIRE(text.has_value());
        CHECK(*text == "No tool responses generated.");
    }
}
