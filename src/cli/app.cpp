#include "mcpevals/cli/app.hpp"
#include "mcpevals/cli/commands.hpp"

// Version string; typically injected by CMake via -DMCPEVALS_VERSION_STRING=...
#ifndef MCPEVALS_VERSION_STRING
#define MCPEVALS_VERSION_STRING "0.1.0-dev"
#endif

namespace mcpevals::cli {

App::App()
    : cli_("mcpevals", "Evaluation harness for MCP servers")
{
    cli_.set_version_flag("--version", MCPEVALS_VERSION_STRING,
                          "Display version information");

    // Global option: log level override.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical, off)")
        ->envname("MCPEVALS_LOG_LEVEL")
        ->default_val("info");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    // The selected subcommand's callback ran inside parse() and stored its
    // exit code.
    return exit_code_;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

void App::setup_commands() {
    register_evaluate_command(cli_, log_level_, exit_code_);
    register_validate_command(cli_, log_level_, exit_code_);
}

} // namespace mcpevals::cli
