#include "mcpevals/cli/commands.hpp"
#include "mcpevals/core/logger.hpp"
#include "mcpevals/core/utils.hpp"
#include "mcpevals/eval/metrics.hpp"
#include "mcpevals/eval/orchestrator.hpp"
#include "mcpevals/eval/runner.hpp"
#include "mcpevals/infra/cancellation.hpp"
#include "mcpevals/mcp/transport_resolver.hpp"
#include "mcpevals/providers/factory.hpp"
#include "mcpevals/report/formatter.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

namespace mcpevals::cli {

namespace {

/// Runs `work` on a fresh io_context. SIGINT/SIGTERM fire the run's
/// cancellation signal; the loop ends once `work` has finished.
template <typename T>
auto run_cancellable(std::function<boost::asio::awaitable<T>(const infra::CancelToken&)> work)
    -> T {
    boost::asio::io_context ioc;
    auto cancel = infra::CancellationSignal::create();

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([cancel](const boost::system::error_code& ec, int sig) {
        if (!ec) {
            LOG_WARN("Received signal {}, cancelling run", sig);
            cancel->cancel();
        }
    });

    std::optional<T> value;
    std::exception_ptr failure;
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            value = co_await work(cancel);
        },
        [&](std::exception_ptr e) {
            failure = e;
            signals.cancel();
        });

    ioc.run();
    if (failure) std::rethrow_exception(failure);
    return std::move(*value);
}

auto api_key_variable(std::string_view provider) -> std::string_view {
    if (provider == "anthropic") return "ANTHROPIC_API_KEY";
    if (provider == "azure-openai") return "AZURE_OPENAI_API_KEY";
    return "OPENAI_API_KEY";
}

void print_load_error(const Error& error) {
    std::cerr << "[ERROR] " << error.what() << "\n";
}

} // anonymous namespace

auto process_env(std::string_view name) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr || *value == '\0') return std::nullopt;
    return std::string(value);
}

void resolve_credentials(LanguageModelConfiguration& model, std::string_view api_key,
                         std::string_view endpoint, const EnvLookup& env) {
    auto provider = utils::to_lower(utils::trim(model.provider));

    if (!api_key.empty()) {
        model.api_key = std::string(api_key);
    } else if (model.api_key.empty()) {
        if (auto value = env(api_key_variable(provider))) model.api_key = *value;
    }

    if (!endpoint.empty()) {
        model.endpoint = std::string(endpoint);
    } else if (model.endpoint.empty() && provider == "azure-openai") {
        if (auto value = env("AZURE_OPENAI_ENDPOINT")) model.endpoint = *value;
    }
}

// ---------------------------------------------------------------------------
// evaluate command
// ---------------------------------------------------------------------------

auto run_evaluate(const EvaluateOptions& options) -> int {
    std::filesystem::path config_path(options.config_path);
    LOG_INFO("Starting evaluations from: {}", config_path.filename().string());

    auto format = report::parse_report_format(options.format);
    if (!format) {
        print_load_error(format.error());
        return 1;
    }

    auto config = load_config(config_path);
    if (!config) {
        print_load_error(config.error());
        return 1;
    }

    resolve_credentials(config->model, options.api_key, options.endpoint);
    LOG_DEBUG("API key: {}, endpoint: {}", config->model.api_key.empty() ? "NOT SET" : "SET",
              config->model.endpoint.empty() ? "NOT SET" : "SET");

    auto provider = providers::create_provider(config->model);
    if (!provider) {
        print_load_error(provider.error());
        return 1;
    }

    std::unique_ptr<eval::LoggingMetricsCollector> metrics;
    if (options.enable_metrics) metrics = std::make_unique<eval::LoggingMetricsCollector>();

    eval::RunOptions run_options;
    run_options.parallelism = options.parallel > 0 ? static_cast<std::size_t>(options.parallel) : 0;

    auto started = std::chrono::steady_clock::now();
    std::vector<EvaluationResult> results;
    try {
        results = run_cancellable<std::vector<EvaluationResult>>(
            [&](const infra::CancelToken& cancel) {
                return eval::run_evaluation_suite(*config, run_options, **provider,
                                                  metrics.get(), cancel);
            });
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Evaluation failed: " << e.what() << "\n";
        return 1;
    }
    auto total = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    auto output = report::format_report(results, *format, total);
    if (options.output_path.empty()) {
        std::cout << output << "\n";
        if (*format == report::ReportFormat::Clean) {
            auto markdown_path = report::clean_report_path(config_path);
            if (auto written = report::write_report(markdown_path, output); !written) {
                LOG_ERROR("{}", written.error().what());
            } else {
                LOG_INFO("Results automatically saved to markdown file: {}", markdown_path.string());
                std::cout << "Results saved to: " << markdown_path.string() << "\n";
            }
        }
    } else {
        if (auto written = report::write_report(options.output_path, output); !written) {
            print_load_error(written.error());
            return 1;
        }
        LOG_INFO("Results written to: {}", options.output_path);
    }

    if (metrics) metrics->log_summary();

    auto summary = eval::summarize(results);
    if (summary.failed > 0) {
        LOG_WARN("Evaluation completed with {} failures", summary.failed);
        return 1;
    }
    LOG_INFO("All evaluations completed successfully");
    return 0;
}

void register_evaluate_command(CLI::App& app, const std::string& log_level, int& exit_code) {
    auto* sub = app.add_subcommand("evaluate", "Run MCP evaluations from a configuration file");
    auto opts = std::make_shared<EvaluateOptions>();

    sub->add_option("config", opts->config_path, "Path to the evaluation configuration file")
        ->required()
        ->check(CLI::ExistingFile);
    sub->add_option("-o,--output", opts->output_path,
                    "Output file for results; without it results go to stdout");
    sub->add_option("-f,--format", opts->format, "Output format: json, summary, detailed or clean")
        ->default_val("clean");
    sub->add_flag("-v,--verbose", opts->verbose, "Enable verbose logging");
    sub->add_option("-p,--parallel", opts->parallel,
                    "Maximum number of parallel evaluations (default: CPU count)")
        ->check(CLI::NonNegativeNumber);
    sub->add_option("--api-key", opts->api_key, "API key for the language model provider");
    sub->add_option("--endpoint", opts->endpoint,
                    "Custom endpoint URL (Azure OpenAI or another compatible service)");
    sub->add_flag("--enable-metrics", opts->enable_metrics, "Log evaluation and connection metrics");

    sub->callback([opts, &log_level, &exit_code]() {
        Logger::init("mcpevals", opts->verbose ? "debug" : log_level);
        exit_code = run_evaluate(*opts);
        Logger::flush();
    });
}

// ---------------------------------------------------------------------------
// validate command
// ---------------------------------------------------------------------------

auto run_validate(const ValidateOptions& options) -> int {
    std::filesystem::path config_path(options.config_path);

    auto config = load_config(config_path);
    if (!config) {
        std::cerr << "[ERROR] Failed to load configuration: " << config.error().what() << "\n";
        return 1;
    }
    std::cout << "Configuration file loaded successfully\n";
    if (options.verbose) {
        std::cout << "  - Found " << config->evals.size() << " evaluations\n";
        std::cout << "  - Language model: " << config->model.provider << "/"
                  << config->model.name << "\n";
        std::cout << "  - Server: " << mcp::resolve_transport_type(config->server) << " "
                  << (config->server.path.empty() ? config->server.url : config->server.path)
                  << "\n";
    }

    auto errors = validate_configuration(*config);
    if (!errors.empty()) {
        std::cerr << "Configuration validation failed:\n";
        for (const auto& error : errors) std::cerr << "  - " << error << "\n";
        return 1;
    }
    std::cout << "Configuration validation passed\n";

    const auto& server = config->server;
    if (!server.path.empty() && !std::filesystem::exists(server.path)) {
        std::cerr << "Server file validation failed:\n";
        std::cerr << "  - Server file not found at " << server.path << "\n";
        return 1;
    }
    std::cout << "Server file check passed\n";

    if (options.check_connectivity) {
        std::cout << "\nTesting MCP server connectivity...\n";
        eval::RunOptions run_options;
        bool connected = false;
        try {
            connected = run_cancellable<bool>([&](const infra::CancelToken& cancel) {
                return eval::check_connectivity(server, run_options, cancel);
            });
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Connectivity test failed: " << e.what() << "\n";
            return 1;
        }
        if (!connected) {
            std::cerr << "Server failed connectivity test\n";
            return 1;
        }
        std::cout << "Server is reachable\n";
    }

    std::cout << "\nConfiguration validation completed successfully\n";
    return 0;
}

void register_validate_command(CLI::App& app, const std::string& log_level, int& exit_code) {
    auto* sub = app.add_subcommand("validate", "Validate an evaluation configuration file");
    auto opts = std::make_shared<ValidateOptions>();

    sub->add_option("config", opts->config_path, "Path to the evaluation configuration file")
        ->required()
        ->check(CLI::ExistingFile);
    sub->add_flag("-v,--verbose", opts->verbose, "Show configuration details");
    sub->add_flag("-c,--check-connectivity", opts->check_connectivity,
                  "Also connect to the server and list its tools");

    sub->callback([opts, &log_level, &exit_code]() {
        Logger::init("mcpevals", opts->verbose ? "debug" : log_level);
        exit_code = run_validate(*opts);
        Logger::flush();
    });
}

} // namespace mcpevals::cli
