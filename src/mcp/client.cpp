#include "mcpevals/mcp/client.hpp"
#include "mcpevals/core/logger.hpp"

namespace mcpevals::mcp {

namespace {

constexpr int kMaxToolPages = 100;

auto not_connected_error() -> Error {
    return make_error(ErrorCode::ConnectionFailed, "Client is not connected");
}

} // anonymous namespace

Client::Client(boost::asio::any_io_executor executor, std::unique_ptr<Transport> transport,
               ClientInfo info)
    : transport_(std::move(transport))
    , info_(std::move(info))
    , mutex_(std::move(executor)) {}

Client::~Client() = default;

auto Client::call(std::string_view method, json params, const infra::CancelToken& cancel)
    -> awaitable<Result<json>> {
    auto request = make_request(next_id_++, method, std::move(params));
    auto response = co_await transport_->request(request, cancel);
    if (!response) co_return make_fail(response.error());

    if (auto err = response_error(*response)) co_return make_fail(std::move(*err));

    auto it = response->find("result");
    if (it == response->end()) {
        co_return make_fail(make_error(ErrorCode::ProtocolError,
                                       "Response to " + std::string(method) + " has no result"));
    }
    co_return std::move(*it);
}

auto Client::connect(const infra::CancelToken& cancel) -> awaitable<VoidResult> {
    auto guard = co_await mutex_.lock(cancel);
    if (!guard) co_return make_fail(guard.error());
    if (connected_) co_return ok_result();

    auto started = co_await transport_->start(cancel);
    if (!started) co_return make_fail(started.error());

    json params = {
        {"protocolVersion", std::string(kProtocolVersion)},
        {"capabilities", json::object()},
        {"clientInfo", {{"name", info_.name}, {"version", info_.version}}},
    };
    auto result = co_await call("initialize", std::move(params), cancel);
    if (!result) {
        co_return make_fail(make_error(ErrorCode::ConnectionFailed,
                                       "MCP initialize failed: " + std::string(result.error().message()),
                                       std::string(result.error().detail())));
    }
    if (result->contains("serverInfo")) server_info_ = (*result)["serverInfo"];

    auto notified = co_await transport_->notify(
        make_notification("notifications/initialized"), cancel);
    if (!notified) co_return make_fail(notified.error());

    connected_ = true;
    LOG_INFO("Connected to {} ({} {})", transport_->describe(),
             server_info_.value("name", "unknown"), server_info_.value("version", ""));
    co_return ok_result();
}

auto Client::list_tools(const infra::CancelToken& cancel)
    -> awaitable<Result<std::vector<Tool>>> {
    auto guard = co_await mutex_.lock(cancel);
    if (!guard) co_return make_fail(guard.error());
    if (!connected_) co_return make_fail(not_connected_error());

    std::vector<Tool> tools;
    std::string cursor;
    for (int page = 0; page < kMaxToolPages; ++page) {
        json params = json::object();
        if (!cursor.empty()) params["cursor"] = cursor;

        auto result = co_await call("tools/list", std::move(params), cancel);
        if (!result) co_return make_fail(result.error());

        auto parsed = parse_tools(*result);
        if (!parsed) co_return make_fail(parsed.error());
        tools.insert(tools.end(), std::make_move_iterator(parsed->begin()),
                     std::make_move_iterator(parsed->end()));

        auto next = result->find("nextCursor");
        if (next == result->end() || !next->is_string() || next->get<std::string>().empty()) {
            break;
        }
        cursor = next->get<std::string>();
    }

    LOG_DEBUG("{} advertises {} tools", transport_->describe(), tools.size());
    co_return tools;
}

auto Client::call_tool(std::string_view name, const json& arguments,
                       const infra::CancelToken& cancel) -> awaitable<Result<ToolCallResult>> {
    auto guard = co_await mutex_.lock(cancel);
    if (!guard) co_return make_fail(guard.error());
    if (!connected_) co_return make_fail(not_connected_error());

    json params = {
        {"name", std::string(name)},
        {"arguments", arguments.is_null() ? json::object() : arguments},
    };
    LOG_DEBUG("Calling tool {} with {}", name, params["arguments"].dump());

    auto result = co_await call("tools/call", std::move(params), cancel);
    if (!result) {
        if (result.error().code() == ErrorCode::Cancelled) co_return make_fail(result.error());
        co_return make_fail(make_error(ErrorCode::ToolInvocationFailed,
                                       std::string(result.error().message()),
                                       std::string(result.error().detail())));
    }
    co_return parse_call_result(*result);
}

auto Client::close() -> awaitable<void> {
    auto guard = co_await mutex_.lock();
    connected_ = false;
    if (guard) {
        co_await transport_->close();
    }
}

auto Client::is_alive() -> bool {
    return transport_->is_alive();
}

auto Client::describe() const -> std::string {
    return transport_->describe();
}

} // namespace mcpevals::mcp
