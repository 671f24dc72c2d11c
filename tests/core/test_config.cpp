#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "mcpevals/core/config.hpp"

using namespace mcpevals;

namespace {

auto minimal_suite() -> json {
    return json::parse(R"({
        "name": "calculator",
        "model": {"provider": "anthropic", "name": "claude-sonnet-4-20250514"},
        "server": {"transport": "stdio", "path": "servers/calc.js"},
        "evals": [
            {"name": "add", "description": "adds", "prompt": "add 5 and 3",
             "expected_result": "8"}
        ]
    })");
}

// RAII helper: writes a file under the temp directory and removes it afterwards.
struct TmpFile {
    std::filesystem::path path;
    TmpFile(const char* name, const std::string& content)
        : path(std::filesystem::temp_directory_path() / name) {
        std::ofstream(path) << content;
    }
    ~TmpFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

} // anonymous namespace

TEST_CASE("parse_config reads a suite", "[config]") {
    auto config = parse_config(minimal_suite(), "/suites");
    REQUIRE(config.has_value());

    CHECK(config->name == "calculator");
    CHECK(config->model.provider == "anthropic");
    CHECK(config->model.max_tokens == 4000);
    CHECK(config->server.transport == "stdio");
    CHECK(config->server.timeout_seconds == 30);
    REQUIRE(config->evals.size() == 1);
    CHECK(config->evals[0].prompt == "add 5 and 3");
    CHECK(config->evals[0].expected_result == "8");
}

TEST_CASE("parse_config resolves relative server paths", "[config]") {
    SECTION("relative to the suite directory") {
        auto config = parse_config(minimal_suite(), "/suites");
        REQUIRE(config.has_value());
        CHECK(config->server.path == "/suites/servers/calc.js");
    }

    SECTION("absolute paths are kept") {
        auto j = minimal_suite();
        j["server"]["path"] = "/opt/servers/calc.js";
        auto config = parse_config(j, "/suites");
        REQUIRE(config.has_value());
        CHECK(config->server.path == "/opt/servers/calc.js");
    }
}

TEST_CASE("parse_config accepts camelCase expectedResult", "[config]") {
    auto j = minimal_suite();
    j["evals"][0].erase("expected_result");
    j["evals"][0]["expectedResult"] = "eight";
    auto config = parse_config(j, "/suites");
    REQUIRE(config.has_value());
    CHECK(config->evals[0].expected_result == "eight");
}

TEST_CASE("parse_config rejects incomplete suites", "[config]") {
    SECTION("no server") {
        auto j = minimal_suite();
        j.erase("server");
        auto config = parse_config(j, "/");
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().message() == "Server configuration is required");
    }

    SECTION("no evaluations") {
        auto j = minimal_suite();
        j["evals"] = json::array();
        auto config = parse_config(j, "/");
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().code() == ErrorCode::InvalidConfig);
    }

    SECTION("evaluation without prompt") {
        auto j = minimal_suite();
        j["evals"][0].erase("prompt");
        auto config = parse_config(j, "/");
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().message() == "Evaluation is missing a prompt");
        CHECK(config.error().detail() == "add");
    }

    SECTION("wrongly typed field") {
        auto j = minimal_suite();
        j["server"]["timeout_seconds"] = "soon";
        CHECK_FALSE(parse_config(j, "/").has_value());
    }
}

TEST_CASE("load_config reads a file", "[config]") {
    SECTION("valid file") {
        TmpFile file("mcpevals_test_suite.json", minimal_suite().dump());
        auto config = load_config(file.path);
        REQUIRE(config.has_value());
        CHECK(config->server.path ==
              (file.path.parent_path() / "servers/calc.js").lexically_normal().string());
    }

    SECTION("malformed JSON") {
        TmpFile file("mcpevals_test_broken.json", "{ not json");
        auto config = load_config(file.path);
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().code() == ErrorCode::InvalidConfig);
    }

    SECTION("missing file") {
        auto config = load_config("/nonexistent/mcpevals/suite.json");
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().message() == "Configuration file not found");
    }
}

TEST_CASE("load_config reads YAML suites", "[config][yaml]") {
    SECTION("same rules as JSON") {
        TmpFile file("mcpevals_test_suite.yaml", R"(name: calculator
model:
  provider: openai
  name: gpt-4o
  max_tokens: 2000
  temperature: 0.3
server:
  transport: stdio
  path: servers/calc.js
  timeout_seconds: 45
evaluations:
  - name: add
    description: adds
    prompt: add 5 and 3
    expectedResult: "8"
)");
        auto config = load_config(file.path);
        REQUIRE(config.has_value());
        CHECK(config->name == "calculator");
        CHECK(config->model.provider == "openai");
        CHECK(config->model.max_tokens == 2000);
        CHECK(config->model.temperature == 0.3);
        CHECK(config->server.timeout_seconds == 45);
        CHECK(config->server.path ==
              (file.path.parent_path() / "servers/calc.js").lexically_normal().string());
        REQUIRE(config->evals.size() == 1);
        CHECK(config->evals[0].prompt == "add 5 and 3");
        CHECK(config->evals[0].expected_result == "8");
    }

    SECTION(".yml extension and quoted scalars") {
        TmpFile file("mcpevals_test_suite.yml", R"(name: "123"
server: {transport: http, url: "http://localhost:8080/mcp"}
evals:
  - {name: "true", description: d, prompt: "42"}
)");
        auto config = load_config(file.path);
        REQUIRE(config.has_value());
        CHECK(config->name == "123");
        CHECK(config->server.url == "http://localhost:8080/mcp");
        CHECK(config->evals[0].name == "true");
        CHECK(config->evals[0].prompt == "42");
    }

    SECTION("malformed YAML") {
        TmpFile file("mcpevals_test_broken.yaml", "server: [unclosed\nevals: {");
        auto config = load_config(file.path);
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().code() == ErrorCode::InvalidConfig);
    }

    SECTION("missing evaluations") {
        TmpFile file("mcpevals_test_empty.yaml", "server:\n  path: calc.js\n");
        auto config = load_config(file.path);
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().message() == "No evaluations found in configuration");
    }
}

TEST_CASE("validate_configuration reports every problem", "[config][validation]") {
    auto config = parse_config(minimal_suite(), "/suites");
    REQUIRE(config.has_value());

    SECTION("valid suite") {
        CHECK(validate_configuration(*config).empty());
    }

    SECTION("bad model settings") {
        config->model.provider = "cohere";
        config->model.temperature = 2.5;
        config->model.max_tokens = 0;
        auto errors = validate_configuration(*config);
        CHECK(errors.size() == 3);
        CHECK(errors[0] == "model: Provider must be one of: openai, anthropic, azure-openai");
    }

    SECTION("stdio without a path") {
        config->server.path.clear();
        auto errors = validate_configuration(*config);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0] == "server: Server path is required for stdio transport");
    }

    SECTION("http needs a path or a url") {
        config->server.transport = "http";
        config->server.path.clear();
        auto errors = validate_configuration(*config);
        REQUIRE(errors.size() == 1);

        config->server.url = "http://localhost:3000/mcp";
        CHECK(validate_configuration(*config).empty());
    }

    SECTION("malformed url") {
        config->server.url = "localhost:3000";
        auto errors = validate_configuration(*config);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0] == "server: Url must be a valid HTTP or HTTPS URL");
    }

    SECTION("evaluation field limits") {
        config->evals[0].name = std::string(101, 'n');
        config->evals[0].description.clear();
        auto errors = validate_configuration(*config);
        REQUIRE(errors.size() == 2);
        CHECK(errors[0] == "evals[0]: Evaluation name must not exceed 100 characters");
        CHECK(errors[1] == "evals[0]: Evaluation description is required");
    }
}

TEST_CASE("Config ${VAR} resolution", "[config]") {
    SECTION("resolves an existing variable") {
        setenv("MCPEVALS_TEST_KEY", "sk-test", 1);
        CHECK(resolve_env_refs("Bearer ${MCPEVALS_TEST_KEY}") == "Bearer sk-test");
    }

    SECTION("preserves unresolved references") {
        CHECK(resolve_env_refs("${MCPEVALS_UNSET_VAR_12345}") == "${MCPEVALS_UNSET_VAR_12345}");
    }

    SECTION("double dollar escapes") {
        CHECK(resolve_env_refs("$${LITERAL}") == "${LITERAL}");
    }

    SECTION("model credentials are resolved while parsing") {
        setenv("MCPEVALS_TEST_KEY", "sk-from-env", 1);
        auto j = minimal_suite();
        j["model"]["api_key"] = "${MCPEVALS_TEST_KEY}";
        auto config = parse_config(j, "/");
        REQUIRE(config.has_value());
        CHECK(config->model.api_key == "sk-from-env");
    }
}
