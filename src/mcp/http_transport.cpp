#include "mcpevals/mcp/http_transport.hpp"
#include "mcpevals/core/logger.hpp"

#include <sstream>
#include <utility>

namespace mcpevals::mcp {

namespace {

constexpr auto kSessionHeader = "Mcp-Session-Id";

} // anonymous namespace

auto find_sse_message(std::string_view body, const json& id) -> std::optional<json> {
    std::istringstream stream{std::string(body)};
    std::string line;
    std::string data;

    auto flush = [&]() -> std::optional<json> {
        if (data.empty()) return std::nullopt;
        auto payload = std::exchange(data, {});
        try {
            auto parsed = json::parse(payload);
            if (parsed.is_object() && parsed.contains("id") && parsed["id"] == id) {
                return parsed;
            }
        } catch (const json::parse_error&) {
            LOG_DEBUG("Skipping malformed SSE event");
        }
        return std::nullopt;
    };

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            if (auto found = flush()) return found;
            continue;
        }
        if (line.starts_with("data:")) {
            auto value = std::string_view(line).substr(5);
            if (value.starts_with(' ')) value.remove_prefix(1);
            if (!data.empty()) data += '\n';
            data += value;
        }
    }
    return flush();
}

HttpTransport::HttpTransport(utils::HttpUrl url,
                             std::unique_ptr<infra::ChildProcess> process,
                             HttpTransportOptions options)
    : url_(std::move(url))
    , process_(std::move(process))
    , options_(options)
    , http_(infra::HttpClientConfig{
          .base_url = url_.origin(),
          .timeout_seconds = options.request_timeout_seconds,
          .default_headers = {
              {"Accept", "application/json, text/event-stream"},
          },
      }) {}

HttpTransport::~HttpTransport() = default;

auto HttpTransport::start(const infra::CancelToken& cancel) -> awaitable<VoidResult> {
    if (infra::is_cancelled(cancel)) co_return make_fail(infra::cancelled_error());
    closed_ = false;
    if (process_ && !process_->running()) {
        co_return make_fail(make_error(ErrorCode::ConnectionFailed,
                                       "Server process is no longer running", describe()));
    }
    co_return ok_result();
}

auto HttpTransport::post(const json& message, const infra::CancelToken& cancel)
    -> awaitable<Result<infra::HttpResponse>> {
    std::map<std::string, std::string> headers;
    if (!session_id_.empty()) headers[kSessionHeader] = session_id_;

    auto response = co_await http_.post(url_.path, message.dump(), "application/json",
                                        headers, cancel);
    if (!response) co_return make_fail(response.error());

    if (auto session = response->header(kSessionHeader); !session.empty()) {
        session_id_ = session;
    }
    if (!response->is_success()) {
        co_return make_fail(make_error(
            ErrorCode::ConnectionFailed,
            "HTTP " + std::to_string(response->status) + " from " + describe(),
            utils::truncate(response->body, 300)));
    }
    co_return response;
}

auto HttpTransport::request(const json& message, const infra::CancelToken& cancel)
    -> awaitable<Result<json>> {
    auto id = message.at("id");
    auto response = co_await post(message, cancel);
    if (!response) co_return make_fail(response.error());

    auto content_type = response->header("Content-Type");
    if (content_type.find("text/event-stream") != std::string::npos) {
        if (auto found = find_sse_message(response->body, id)) co_return std::move(*found);
        co_return make_fail(make_error(ErrorCode::ProtocolError,
                                       "No response in event stream", describe()));
    }

    try {
        auto parsed = json::parse(response->body);
        if (parsed.is_array()) {
            for (auto& item : parsed) {
                if (item.is_object() && item.contains("id") && item["id"] == id) {
                    co_return std::move(item);
                }
            }
        } else if (parsed.is_object()) {
            co_return parsed;
        }
    } catch (const json::parse_error& e) {
        co_return make_fail(make_error(ErrorCode::ProtocolError,
                                       "Malformed JSON-RPC response", e.what()));
    }
    co_return make_fail(make_error(ErrorCode::ProtocolError,
                                   "No matching JSON-RPC response", describe()));
}

auto HttpTransport::notify(const json& message, const infra::CancelToken& cancel)
    -> awaitable<VoidResult> {
    auto response = co_await post(message, cancel);
    if (!response) co_return make_fail(response.error());
    co_return ok_result();
}

auto HttpTransport::close() -> awaitable<void> {
    session_id_.clear();
    closed_ = true;
    if (!process_) co_return;
    auto process = std::move(process_);
    co_await process->terminate(options_.shutdown_grace);
    LOG_DEBUG("HTTP server process stopped: {}", process->command_line());
}

auto HttpTransport::is_alive() -> bool {
    return !closed_ && (!process_ || process_->running());
}

auto HttpTransport::describe() const -> std::string {
    return "http:" + url_.origin() + url_.path;
}

} // namespace mcpevals::mcp
