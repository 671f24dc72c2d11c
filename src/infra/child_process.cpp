#include "mcpevals/infra/child_process.hpp"
#include "mcpevals/core/logger.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace mcpevals::infra {

namespace {

constexpr size_t kTailLimit = 8192;
constexpr auto kExitPollInterval = std::chrono::milliseconds(50);

using Descriptor = boost::asio::posix::stream_descriptor;

struct OutputTail {
    mutable std::mutex mtx;
    std::string data;

    void append(const char* bytes, size_t n) {
        std::lock_guard lock(mtx);
        data.append(bytes, n);
        if (data.size() > kTailLimit) {
            data.erase(0, data.size() - kTailLimit);
        }
    }
};

auto drain(std::shared_ptr<Descriptor> pipe, std::shared_ptr<OutputTail> tail)
    -> boost::asio::awaitable<void> {
    std::array<char, 4096> buf{};
    for (;;) {
        boost::system::error_code ec;
        auto n = co_await pipe->async_read_some(
            boost::asio::buffer(buf),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (n > 0) tail->append(buf.data(), n);
        if (ec) co_return;
    }
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

struct Pipe {
    int read = -1;
    int write = -1;

    ~Pipe() {
        close_fd(read);
        close_fd(write);
    }

    /// Both ends are close-on-exec, so siblings spawned later never inherit them.
    auto open() -> bool {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) return false;
        read = fds[0];
        write = fds[1];
        return true;
    }

    /// Hands ownership of the read end to the caller.
    auto take_read() -> int { return std::exchange(read, -1); }
    auto take_write() -> int { return std::exchange(write, -1); }
};

/// dup2 clears close-on-exec on the target; a pipe end that already sits on
/// the target keeps it, so the flag is cleared by hand.
void redirect_fd(int fd, int target) {
    if (fd == target) {
        static_cast<void>(::fcntl(fd, F_SETFD, 0));
    } else {
        static_cast<void>(::dup2(fd, target));
    }
}

auto decode_status(int status) -> int {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

auto describe(const ProcessSpec& spec) -> std::string {
    std::string out = spec.program;
    for (const auto& a : spec.args) {
        out += ' ';
        out += a;
    }
    return out;
}

} // anonymous namespace

struct ChildProcess::Impl {
    pid_t pid = -1;
    std::optional<int> exit_status;
    std::string command_line;
    std::shared_ptr<OutputTail> tail = std::make_shared<OutputTail>();
    std::unique_ptr<Descriptor> stdin_pipe;
    std::unique_ptr<Descriptor> stdout_pipe;
    std::vector<std::shared_ptr<Descriptor>> drained;

    auto poll_exit() -> bool {
        if (exit_status) return true;
        if (pid <= 0) return true;
        int status = 0;
        auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            exit_status = decode_status(status);
            return true;
        }
        if (waited < 0) {
            exit_status = -1;
            return true;
        }
        return false;
    }

    void signal_group(int sig) {
        if (pid <= 0) return;
        if (::kill(-pid, sig) != 0) {
            static_cast<void>(::kill(pid, sig));
        }
    }

    void close_pipes() {
        boost::system::error_code ec;
        if (stdin_pipe) stdin_pipe->close(ec);
        if (stdout_pipe) stdout_pipe->close(ec);
        for (auto& d : drained) {
            d->close(ec);
        }
    }
};

ChildProcess::ChildProcess(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

auto ChildProcess::spawn(boost::asio::any_io_executor executor, const ProcessSpec& spec)
    -> Result<std::unique_ptr<ChildProcess>> {
    ignore_sigpipe();

    Pipe in_pipe, out_pipe, err_pipe, exec_status;
    if (!in_pipe.open() || !out_pipe.open() || !err_pipe.open() || !exec_status.open()) {
        return std::unexpected(make_error(ErrorCode::ServerStartFailed,
                                          "Failed to create process pipes",
                                          std::strerror(errno)));
    }

    std::vector<std::string> argv_storage;
    argv_storage.push_back(spec.program);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    auto working_dir = spec.working_dir.string();

    const pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(make_error(ErrorCode::ServerStartFailed,
                                          "Failed to fork process", std::strerror(errno)));
    }

    if (pid == 0) {
        static_cast<void>(::setpgid(0, 0));
        redirect_fd(in_pipe.read, STDIN_FILENO);
        redirect_fd(out_pipe.write, STDOUT_FILENO);
        redirect_fd(err_pipe.write, STDERR_FILENO);
        for (int fd : {in_pipe.read, in_pipe.write, out_pipe.read, out_pipe.write,
                       err_pipe.read, err_pipe.write, exec_status.read}) {
            if (fd > STDERR_FILENO) static_cast<void>(::close(fd));
        }
        if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
            int err = errno;
            static_cast<void>(::write(exec_status.write, &err, sizeof(err)));
            ::_exit(126);
        }
        ::execvp(argv[0], argv.data());
        int err = errno;
        static_cast<void>(::write(exec_status.write, &err, sizeof(err)));
        ::_exit(127);
    }

    close_fd(in_pipe.read);
    close_fd(out_pipe.write);
    close_fd(err_pipe.write);
    close_fd(exec_status.write);

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_status.read, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        static_cast<void>(::waitpid(pid, &status, 0));
        return std::unexpected(make_error(ErrorCode::ServerStartFailed,
                                          "Failed to launch " + spec.program,
                                          std::strerror(child_errno)));
    }

    auto impl = std::make_unique<Impl>();
    impl->pid = pid;
    impl->command_line = describe(spec);

    auto err_desc = std::make_shared<Descriptor>(executor, err_pipe.take_read());
    impl->drained.push_back(err_desc);
    boost::asio::co_spawn(executor, drain(err_desc, impl->tail), boost::asio::detached);

    if (spec.pipe_stdio) {
        impl->stdin_pipe = std::make_unique<Descriptor>(executor, in_pipe.take_write());
        impl->stdout_pipe = std::make_unique<Descriptor>(executor, out_pipe.take_read());
    } else {
        close_fd(in_pipe.write);
        auto out_desc = std::make_shared<Descriptor>(executor, out_pipe.take_read());
        impl->drained.push_back(out_desc);
        boost::asio::co_spawn(executor, drain(out_desc, impl->tail), boost::asio::detached);
    }

    LOG_DEBUG("Spawned pid {}: {} (cwd: {})", pid, impl->command_line,
              working_dir.empty() ? "." : working_dir);
    return std::unique_ptr<ChildProcess>(new ChildProcess(std::move(impl)));
}

ChildProcess::~ChildProcess() {
    if (!impl_) return;
    impl_->close_pipes();
    if (!impl_->poll_exit()) {
        impl_->signal_group(SIGKILL);
        int status = 0;
        static_cast<void>(::waitpid(impl_->pid, &status, 0));
    }
}

auto ChildProcess::pid() const noexcept -> pid_t {
    return impl_->pid;
}

auto ChildProcess::running() -> bool {
    return !impl_->poll_exit();
}

auto ChildProcess::exit_code() -> std::optional<int> {
    impl_->poll_exit();
    return impl_->exit_status;
}

auto ChildProcess::terminate(std::chrono::milliseconds grace)
    -> boost::asio::awaitable<void> {
    close_stdin();
    if (impl_->poll_exit()) co_return;

    LOG_DEBUG("Terminating pid {} ({})", impl_->pid, impl_->command_line);
    impl_->signal_group(SIGTERM);

    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (impl_->poll_exit()) co_return;
        timer.expires_after(kExitPollInterval);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (!impl_->poll_exit()) {
        LOG_WARN("pid {} did not exit within {} ms, killing", impl_->pid, grace.count());
        impl_->signal_group(SIGKILL);
        int status = 0;
        if (::waitpid(impl_->pid, &status, 0) == impl_->pid) {
            impl_->exit_status = decode_status(status);
        } else {
            impl_->exit_status = -1;
        }
    }
}

auto ChildProcess::stdin_pipe() -> boost::asio::posix::stream_descriptor* {
    return impl_->stdin_pipe.get();
}

auto ChildProcess::stdout_pipe() -> boost::asio::posix::stream_descriptor* {
    return impl_->stdout_pipe.get();
}

void ChildProcess::close_stdin() {
    if (impl_->stdin_pipe && impl_->stdin_pipe->is_open()) {
        boost::system::error_code ec;
        impl_->stdin_pipe->close(ec);
    }
}

auto ChildProcess::output_tail() const -> std::string {
    std::lock_guard lock(impl_->tail->mtx);
    return impl_->tail->data;
}

auto ChildProcess::command_line() const -> const std::string& {
    return impl_->command_line;
}

} // namespace mcpevals::infra
