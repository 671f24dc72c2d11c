#include "mcpevals/mcp/stdio_transport.hpp"
#include "mcpevals/core/logger.hpp"
#include "mcpevals/core/utils.hpp"
#include "mcpevals/mcp/protocol.hpp"

#include <array>

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

namespace mcpevals::mcp {

namespace {

constexpr int kMethodNotFound = -32601;

} // anonymous namespace

StdioTransport::StdioTransport(boost::asio::any_io_executor executor, LaunchCommand command,
                               std::chrono::milliseconds shutdown_grace)
    : executor_(std::move(executor))
    , command_(std::move(command))
    , shutdown_grace_(shutdown_grace) {}

StdioTransport::~StdioTransport() = default;

auto StdioTransport::start(const infra::CancelToken& cancel) -> awaitable<VoidResult> {
    if (process_) co_return ok_result();
    if (infra::is_cancelled(cancel)) co_return make_fail(infra::cancelled_error());

    auto spawned = infra::ChildProcess::spawn(executor_, infra::ProcessSpec{
        .program = command_.program,
        .args = command_.args,
        .working_dir = command_.working_dir,
        .pipe_stdio = true,
    });
    if (!spawned) co_return make_fail(spawned.error());

    process_ = std::move(*spawned);
    broken_ = false;
    read_buffer_.clear();
    LOG_INFO("Started stdio server: {}", process_->command_line());
    co_return ok_result();
}

auto StdioTransport::request(const json& message, const infra::CancelToken& cancel)
    -> awaitable<Result<json>> {
    auto id = message.at("id");

    auto written = co_await write_message(message, cancel);
    if (!written) co_return make_fail(written.error());

    for (;;) {
        auto incoming = co_await read_message(cancel);
        if (!incoming) co_return make_fail(incoming.error());

        if (incoming->contains("method")) {
            // Server-initiated traffic. Notifications are dropped; requests
            // get a reply so the server is never left waiting.
            if (incoming->contains("id")) {
                const auto& method = (*incoming)["method"];
                auto reply = method == "ping"
                    ? make_response((*incoming)["id"], json::object())
                    : make_error_response((*incoming)["id"], kMethodNotFound, "Method not found");
                auto sent = co_await write_message(reply, cancel);
                if (!sent) co_return make_fail(sent.error());
            }
            continue;
        }

        if (incoming->contains("id") && (*incoming)["id"] == id) {
            co_return std::move(*incoming);
        }
        LOG_DEBUG("Discarding stale response {} from {}",
                  incoming->value("id", json()).dump(), describe());
    }
}

auto StdioTransport::notify(const json& message, const infra::CancelToken& cancel)
    -> awaitable<VoidResult> {
    co_return co_await write_message(message, cancel);
}

auto StdioTransport::write_message(const json& message, const infra::CancelToken& cancel)
    -> awaitable<VoidResult> {
    if (!process_ || !process_->stdin_pipe() || broken_) {
        co_return make_fail(closed_error("Server is not running"));
    }

    auto* in = process_->stdin_pipe();
    auto registration = infra::on_cancel(cancel, [in] {
        boost::system::error_code ignored;
        in->cancel(ignored);
    });

    auto line = message.dump() + "\n";
    boost::system::error_code ec;
    co_await boost::asio::async_write(*in, boost::asio::buffer(line),
                                      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (infra::is_cancelled(cancel)) co_return make_fail(infra::cancelled_error());
    if (ec) {
        broken_ = true;
        co_return make_fail(closed_error("Failed to write to server: " + ec.message()));
    }
    LOG_TRACE("-> {}", line);
    co_return ok_result();
}

auto StdioTransport::read_message(const infra::CancelToken& cancel) -> awaitable<Result<json>> {
    if (!process_ || !process_->stdout_pipe() || broken_) {
        co_return make_fail(closed_error("Server is not running"));
    }
    auto* out = process_->stdout_pipe();

    for (;;) {
        auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            auto line = utils::trim(std::string_view(read_buffer_).substr(0, newline));
            read_buffer_.erase(0, newline + 1);
            if (line.empty()) continue;
            try {
                auto parsed = json::parse(line);
                LOG_TRACE("<- {}", line);
                if (parsed.is_object()) co_return parsed;
            } catch (const json::parse_error&) {
                LOG_DEBUG("Ignoring non-JSON output from {}: {}", describe(),
                          utils::truncate(line, 200));
            }
            continue;
        }

        auto registration = infra::on_cancel(cancel, [out] {
            boost::system::error_code ignored;
            out->cancel(ignored);
        });

        std::array<char, 4096> buf{};
        boost::system::error_code ec;
        auto n = co_await out->async_read_some(
            boost::asio::buffer(buf),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        read_buffer_.append(buf.data(), n);

        if (infra::is_cancelled(cancel)) co_return make_fail(infra::cancelled_error());
        if (ec) {
            broken_ = true;
            co_return make_fail(closed_error("Server closed its output"));
        }
    }
}

auto StdioTransport::closed_error(std::string_view what) -> Error {
    std::string detail = describe();
    if (process_) {
        if (auto code = process_->exit_code()) {
            detail += ", exit code " + std::to_string(*code);
        }
        auto tail = utils::trim(process_->output_tail());
        if (!tail.empty()) {
            detail += ", stderr: " + utils::truncate(tail, 500);
        }
    }
    return make_error(ErrorCode::ConnectionClosed, std::string(what), detail);
}

auto StdioTransport::close() -> awaitable<void> {
    if (!process_) co_return;
    auto process = std::move(process_);
    co_await process->terminate(shutdown_grace_);
    LOG_DEBUG("Stdio server stopped: {}", process->command_line());
}

auto StdioTransport::is_alive() -> bool {
    return process_ && !broken_ && process_->running();
}

auto StdioTransport::describe() const -> std::string {
    auto text = command_.program;
    for (const auto& a : command_.args) {
        text += ' ';
        text += a;
    }
    return "stdio:" + text;
}

} // namespace mcpevals::mcp
