#include "mcpevals/mcp/process_manager.hpp"
#include "mcpevals/core/logger.hpp"
#include "mcpevals/core/utils.hpp"
#include "mcpevals/infra/http_client.hpp"
#include "mcpevals/mcp/server_type.hpp"

#include <boost/asio/this_coro.hpp>

namespace mcpevals::mcp {

namespace {

constexpr auto kStartupShutdownGrace = std::chrono::seconds(5);

} // anonymous namespace

ServerProcessManager::ServerProcessManager(ProcessManagerOptions options, ReadinessProbe probe)
    : options_(options)
    , probe_(probe ? std::move(probe) : http_ping_probe(options.readiness.probe_timeout)) {}

auto ServerProcessManager::start_server(ServerType type, const std::filesystem::path& path,
                                        const ServerConfiguration& config,
                                        const infra::CancelToken& cancel)
    -> awaitable<Result<std::unique_ptr<infra::ChildProcess>>> {
    if (find_launcher(type) == nullptr) {
        co_return make_fail(make_error(ErrorCode::InvalidConfig,
                                       "Unsupported server type: " +
                                           std::string(server_type_to_string(type)),
                                       path.string()));
    }
    if (!std::filesystem::exists(path)) {
        co_return make_fail(make_error(ErrorCode::ServerStartFailed,
                                       "Server file not found", path.string()));
    }

    auto command = build_launch_command(type, path, config.args);
    LOG_INFO("Starting {} server: {}", server_type_to_string(type), path.string());

    auto executor = co_await boost::asio::this_coro::executor;
    auto spawned = infra::ChildProcess::spawn(executor, infra::ProcessSpec{
        .program = command.program,
        .args = command.args,
        .working_dir = command.working_dir,
        .pipe_stdio = false,
    });
    if (!spawned) co_return make_fail(spawned.error());
    auto process = std::move(*spawned);

    auto settled = co_await infra::sleep_for(options_.settle_delay, cancel);
    if (!settled) {
        co_await process->terminate(kStartupShutdownGrace);
        co_return make_fail(settled.error());
    }

    if (!process->running()) {
        auto code = process->exit_code().value_or(-1);
        co_return make_fail(make_error(
            ErrorCode::ServerStartFailed,
            "Server process exited immediately with code: " + std::to_string(code),
            utils::truncate(utils::trim(process->output_tail()), 500)));
    }

    LOG_DEBUG("Server process {} is running", process->pid());
    co_return std::move(process);
}

auto ServerProcessManager::is_server_ready(const std::string& endpoint,
                                           const infra::CancelToken& cancel,
                                           std::optional<std::chrono::milliseconds> budget)
    -> awaitable<bool> {
    const auto& policy = options_.readiness;
    auto started = std::chrono::steady_clock::now();

    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        if (infra::is_cancelled(cancel)) co_return false;

        if (co_await probe_(endpoint, cancel)) {
            LOG_INFO("Server at {} is ready (attempt {})", endpoint, attempt);
            co_return true;
        }
        LOG_DEBUG("Server at {} not ready (attempt {}/{})", endpoint, attempt,
                  policy.max_attempts);

        if (attempt == policy.max_attempts) break;

        auto elapsed = std::chrono::steady_clock::now() - started;
        if (budget && elapsed + policy.interval > *budget) {
            LOG_WARN("Readiness budget of {} ms exhausted for {}", budget->count(), endpoint);
            co_return false;
        }

        auto slept = co_await infra::sleep_for(policy.interval, cancel);
        if (!slept) co_return false;
    }

    LOG_WARN("Server at {} did not become ready after {} attempts", endpoint,
             policy.max_attempts);
    co_return false;
}

auto ServerProcessManager::http_ping_probe(std::chrono::seconds timeout) -> ReadinessProbe {
    return [timeout](const std::string& endpoint,
                     const infra::CancelToken& cancel) -> awaitable<bool> {
        auto url = utils::parse_http_url(endpoint);
        if (!url) co_return false;

        infra::HttpClient http(infra::HttpClientConfig{
            .base_url = url->origin(),
            .timeout_seconds = static_cast<int>(timeout.count()),
            .connect_timeout_seconds = static_cast<int>(timeout.count()),
        });
        static const std::string kPing = R"({"jsonrpc":"2.0","method":"ping","id":1})";
        auto response = co_await http.post(url->path, kPing, "application/json", {}, cancel);
        co_return response.has_value();
    };
}

} // namespace mcpevals::mcp
