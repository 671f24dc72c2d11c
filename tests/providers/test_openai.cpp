#include <catch2/catch_test_macros.hpp>

#include <utility>
#include <boost/asio.hpp>

#include "mcpevals/providers/openai.hpp"
#include "../support/loopback_http.hpp"
#include "../support/run_sync.hpp"

using namespace mcpevals;
using namespace mcpevals::providers;
using mcpevals::testing::LoopbackHttp;
using mcpevals::testing::run_sync;

namespace {

constexpr auto kCompletion = R"({
    "id": "chatcmpl-1",
    "model": "gpt-4o-2024-08-06",
    "choices": [{"index": 0, "finish_reason": "stop",
                 "message": {"role": "assistant", "content": "{\"toolName\": \"add\"}"}}],
    "usage": {"prompt_tokens": 120, "completion_tokens": 9}
})";

auto planning_request() -> CompletionRequest {
    CompletionRequest req;
    req.model = "gpt-4o";
    req.system_prompt = "Pick a tool";
    req.messages.push_back({.role = "user", .content = "User prompt: add 5 and 3"});
    req.temperature = 0.1;
    req.max_tokens = 500;
    req.json_output = true;
    return req;
}

} // anonymous namespace

TEST_CASE("OpenAI request body", "[providers][openai]") {
    OpenAIProvider provider(ProviderConfig{.api_key = "sk-test"});
    auto body = provider.build_request_body(planning_request());

    CHECK(body["model"] == "gpt-4o");
    REQUIRE(body["messages"].size() == 2);
    CHECK(body["messages"][0]["role"] == "system");
    CHECK(body["messages"][1]["content"] == "User prompt: add 5 and 3");
    CHECK(body["max_tokens"] == 500);
    CHECK(body["response_format"]["type"] == "json_object");

    SECTION("unset options are omitted") {
        CompletionRequest plain;
        plain.messages.push_back({.role = "user", .content = "hi"});
        auto minimal = provider.build_request_body(plain);
        CHECK(minimal["model"] == "gpt-4o");
        CHECK(minimal["messages"].size() == 1);
        CHECK_FALSE(minimal.contains("temperature"));
        CHECK_FALSE(minimal.contains("response_format"));
    }
}

TEST_CASE("OpenAI response parsing", "[providers][openai]") {
    auto parsed = OpenAIProvider::parse_response(kCompletion);
    REQUIRE(parsed.has_value());
    CHECK(parsed->text == "{\"toolName\": \"add\"}");
    CHECK(parsed->stop_reason == "stop");
    CHECK(parsed->input_tokens == 120);
    CHECK(parsed->output_tokens == 9);

    CHECK_FALSE(OpenAIProvider::parse_response("not json").has_value());
    CHECK_FALSE(OpenAIProvider::parse_response(R"({"choices": []})").has_value());

    auto error = OpenAIProvider::parse_response(R"({"error": {"message": "quota"}})");
    REQUIRE_FALSE(error.has_value());
    CHECK(error.error().detail() == "quota");
}

TEST_CASE("OpenAI completion paths", "[providers][openai]") {
    SECTION("standard") {
        OpenAIProvider provider(ProviderConfig{.api_key = "k"});
        CHECK(provider.completions_path() == "/v1/chat/completions");
        CHECK(provider.name() == "openai");
    }

    SECTION("compatible gateway mounted under /v1") {
        OpenAIProvider provider(ProviderConfig{.api_key = "k", .path_prefix = "/proxy/v1/"});
        CHECK(provider.completions_path() == "/proxy/v1/chat/completions");
    }

    SECTION("azure deployment") {
        OpenAIProvider provider(ProviderConfig{.api_key = "k", .model = "gpt4o-eval"},
                                OpenAIProvider::Flavor::Azure);
        CHECK(provider.completions_path() ==
              "/openai/deployments/gpt4o-eval/chat/completions?api-version=2024-06-01");
        CHECK(provider.name() == "azure-openai");
    }
}

TEST_CASE("OpenAI complete over HTTP", "[providers][openai]") {
    boost::asio::io_context ioc;

    SECTION("bearer auth on the standard path") {
        LoopbackHttp server(200, kCompletion);
        OpenAIProvider provider(ProviderConfig{.api_key = "sk-test", .base_url = server.origin()});

        auto response = run_sync(ioc, provider.complete(planning_request(), {}));
        REQUIRE(response.has_value());
        CHECK(response->model == "gpt-4o-2024-08-06");

        auto seen = server.last();
        CHECK(seen.path == "/v1/chat/completions");
        CHECK(seen.authorization == "Bearer sk-test");
        CHECK(json::parse(seen.body)["temperature"] == 0.1);
    }

    SECTION("api-key header for azure") {
        LoopbackHttp server(200, kCompletion);
        OpenAIProvider provider(ProviderConfig{.api_key = "azure-key",
                                               .base_url = server.origin(),
                                               .model = "eval-deployment"},
                                OpenAIProvider::Flavor::Azure);

        auto response = run_sync(ioc, provider.generate("system", "user", {}, {}));
        REQUIRE(response.has_value());
        CHECK(*response == "{\"toolName\": \"add\"}");

        auto seen = server.last();
        CHECK(seen.path == "/openai/deployments/eval-deployment/chat/completions");
        CHECK(seen.query_api_version == "2024-06-01");
        CHECK(seen.api_key == "azure-key");
        CHECK(seen.authorization.empty());
    }

    SECTION("HTTP errors carry the provider message") {
        LoopbackHttp server(429, R"({"error": {"message": "Rate limit reached"}})");
        OpenAIProvider provider(ProviderConfig{.api_key = "k", .base_url = server.origin()});

        auto response = run_sync(ioc, provider.complete(planning_request(), {}));
        REQUIRE_FALSE(response.has_value());
        CHECK(response.error().code() == ErrorCode::ProviderError);
        CHECK(response.error().message() == "openai API error (HTTP 429)");
        CHECK(response.error().detail() == "Rate limit reached");
    }

    SECTION("unreachable endpoint") {
        OpenAIProvider provider(ProviderConfig{.api_key = "k", .base_url = "http://127.0.0.1:1"});
        auto response = run_sync(ioc, provider.complete(planning_request(), {}));
        REQUIRE_FALSE(response.has_value());
        CHECK(response.error().code() == ErrorCode::ConnectionFailed);
    }
}
