#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "mcpevals/core/config.hpp"

namespace mcpevals::cli {

struct EvaluateOptions {
    std::string config_path;
    std::string output_path;
    std::string format = "clean";
    bool verbose = false;
    int parallel = 0;  // 0: one per hardware thread
    std::string api_key;
    std::string endpoint;
    bool enable_metrics = false;
};

struct ValidateOptions {
    std::string config_path;
    bool verbose = false;
    bool check_connectivity = false;
};

using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// Reads the process environment.
auto process_env(std::string_view name) -> std::optional<std::string>;

/// Fills in the API key and endpoint: command-line values win, then the
/// configuration, then the provider's environment variables
/// (OPENAI_API_KEY, ANTHROPIC_API_KEY, AZURE_OPENAI_API_KEY,
/// AZURE_OPENAI_ENDPOINT).
void resolve_credentials(LanguageModelConfiguration& model, std::string_view api_key,
                         std::string_view endpoint, const EnvLookup& env = process_env);

/// Register the `evaluate` subcommand.
/// Runs every evaluation in a configuration file and reports the results.
void register_evaluate_command(CLI::App& app, const std::string& log_level, int& exit_code);

/// Register the `validate` subcommand.
/// Checks a configuration file and optionally the server's connectivity.
void register_validate_command(CLI::App& app, const std::string& log_level, int& exit_code);

auto run_evaluate(const EvaluateOptions& options) -> int;
auto run_validate(const ValidateOptions& options) -> int;

} // namespace mcpevals::cli
