#pragma once

#include <string>

#include <CLI/CLI.hpp>

namespace mcpevals::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// `evaluate` and `validate` subcommands. The selected subcommand runs
/// inside parse() and records the process exit code.
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

private:
    void setup_commands();

    CLI::App cli_;
    std::string log_level_ = "info";
    int exit_code_ = 0;
};

} // namespace mcpevals::cli
