#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "mcpevals/core/error.hpp"

namespace mcpevals::infra {

struct ProcessSpec {
    std::string program;             // resolved through PATH when not a path
    std::vector<std::string> args;
    std::filesystem::path working_dir;
    bool pipe_stdio = false;         // expose stdin/stdout to the caller
};

/// A child process launched with fork/exec in its own process group.
/// Captured output (stderr, plus stdout unless piped to the caller) is drained
/// into a bounded tail buffer for diagnostics. Destroying a still-running
/// child kills and reaps it.
class ChildProcess {
public:
    static auto spawn(boost::asio::any_io_executor executor, const ProcessSpec& spec)
        -> Result<std::unique_ptr<ChildProcess>>;

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] auto pid() const noexcept -> pid_t;

    /// Reaps the child if it has exited.
    [[nodiscard]] auto running() -> bool;

    /// Exit code once the child has exited; 128 + signal when it was killed.
    [[nodiscard]] auto exit_code() -> std::optional<int>;

    /// SIGTERM, wait up to `grace` for exit, then SIGKILL.
    auto terminate(std::chrono::milliseconds grace) -> boost::asio::awaitable<void>;

    /// Null unless spawned with pipe_stdio.
    [[nodiscard]] auto stdin_pipe() -> boost::asio::posix::stream_descriptor*;
    [[nodiscard]] auto stdout_pipe() -> boost::asio::posix::stream_descriptor*;

    /// Closes the write end of the child's stdin.
    void close_stdin();

    [[nodiscard]] auto output_tail() const -> std::string;
    [[nodiscard]] auto command_line() const -> const std::string&;

private:
    struct Impl;
    explicit ChildProcess(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace mcpevals::infra
