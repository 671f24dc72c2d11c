#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "mcpevals/core/error.hpp"
#include "mcpevals/infra/cancellation.hpp"
#include "mcpevals/mcp/protocol.hpp"
#include "mcpevals/mcp/transport.hpp"
#include "mcpevals/mcp/transport_factory.hpp"
#include "mcpevals/providers/provider.hpp"

// In-process stand-ins for a server connection and a language model.

namespace mcpevals::testing {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Observable state of a FakeTransport, shared with the test after the
/// transport itself has been handed to a client.
struct FakeTransportState {
    int starts = 0;
    int closes = 0;
    bool alive = true;
    bool fail_start = false;
    std::vector<json> requests;
    std::vector<json> notifications;
};

/// Answers like a small calculator server: add, echo and broken (which
/// returns a JSON-RPC error).
inline auto calculator_reply(const json& request) -> json {
    const auto& id = request["id"];
    auto method = request.value("method", "");
    auto params = request.value("params", json::object());

    if (method == "initialize") {
        return mcp::make_response(id, {
            {"protocolVersion", params.value("protocolVersion", "")},
            {"capabilities", {{"tools", json::object()}}},
            {"serverInfo", {{"name", "fake-calculator"}, {"version", "2.0.0"}}},
        });
    }
    if (method == "tools/list") {
        return mcp::make_response(id, {{"tools", json::array({
            {{"name", "add"}, {"description", "Add two numbers together"}},
            {{"name", "echo"}, {"description", "Echo back the provided message"}},
            {{"name", "broken"}, {"description", "Always fails"}},
        })}});
    }
    if (method == "tools/call") {
        auto name = params.value("name", "");
        auto args = params.value("arguments", json::object());
        if (name == "add") {
            auto sum = args.value("a", 0.0) + args.value("b", 0.0);
            return mcp::make_response(id, {{"content", json::array({
                {{"type", "text"}, {"text", std::to_string(static_cast<long long>(sum))}},
            })}});
        }
        if (name == "echo") {
            return mcp::make_response(id, {{"content", json::array({
                {{"type", "text"}, {"text", args.value("message", "")}},
            })}});
        }
        return mcp::make_error_response(id, -32000, "Tool " + name + " exploded");
    }
    return mcp::make_error_response(id, -32601, "Method not found");
}

class FakeTransport final : public mcp::Transport {
public:
    using Handler = std::function<json(const json&)>;

    explicit FakeTransport(std::shared_ptr<FakeTransportState> state,
                           Handler handler = calculator_reply)
        : state_(std::move(state)), handler_(std::move(handler)) {}

    auto start(const infra::CancelToken& cancel) -> awaitable<VoidResult> override {
        if (infra::is_cancelled(cancel)) co_return make_fail(infra::cancelled_error());
        ++state_->starts;
        if (state_->fail_start) {
            co_return make_fail(make_error(ErrorCode::ServerStartFailed, "fake start failure"));
        }
        co_return ok_result();
    }

    auto request(const json& message, const infra::CancelToken& cancel)
        -> awaitable<Result<json>> override {
        if (infra::is_cancelled(cancel)) co_return make_fail(infra::cancelled_error());
        if (!state_->alive) {
            co_return make_fail(make_error(ErrorCode::ConnectionClosed, "fake server exited"));
        }
        state_->requests.push_back(message);
        co_return handler_(message);
    }

    auto notify(const json& message, const infra::CancelToken&) -> awaitable<VoidResult> override {
        state_->notifications.push_back(message);
        co_return ok_result();
    }

    auto close() -> awaitable<void> override {
        ++state_->closes;
        co_return;
    }

    auto is_alive() -> bool override { return state_->alive; }

    auto describe() const -> std::string override { return "fake"; }

private:
    std::shared_ptr<FakeTransportState> state_;
    Handler handler_;
};

/// Hands out FakeTransports, optionally after a delay or with a failure.
class FakeTransportFactory final : public mcp::TransportFactory {
public:
    std::chrono::milliseconds delay{0};
    std::optional<Error> failure;
    std::vector<std::shared_ptr<FakeTransportState>> states;
    std::vector<std::string> kinds;

    auto create(std::string_view kind, const ServerConfiguration&,
                const infra::CancelToken& cancel)
        -> awaitable<Result<std::unique_ptr<mcp::Transport>>> override {
        kinds.emplace_back(kind);
        if (delay.count() > 0) {
            auto slept = co_await infra::sleep_for(delay, cancel);
            if (!slept) co_return make_fail(slept.error());
        }
        if (failure) co_return make_fail(*failure);

        auto state = std::make_shared<FakeTransportState>();
        states.push_back(state);
        co_return std::unique_ptr<mcp::Transport>(std::make_unique<FakeTransport>(state));
    }
};

/// Language model whose replies come from a callback.
class ScriptedProvider final : public providers::Provider {
public:
    using Script = std::function<Result<std::string>(const providers::CompletionRequest&)>;

    explicit ScriptedProvider(Script script) : script_(std::move(script)) {}

    auto complete(providers::CompletionRequest req, const infra::CancelToken& cancel)
        -> awaitable<Result<providers::CompletionResponse>> override {
        if (infra::is_cancelled(cancel)) co_return make_fail(infra::cancelled_error());
        requests.push_back(req);
        auto text = script_(req);
        if (!text) co_return make_fail(text.error());
        co_return providers::CompletionResponse{.text = std::move(*text), .model = req.model};
    }

    auto name() const -> std::string_view override { return "scripted"; }

    std::vector<providers::CompletionRequest> requests;

private:
    Script script_;
};

inline auto unavailable_model() -> ScriptedProvider::Script {
    return [](const providers::CompletionRequest&) -> Result<std::string> {
        return std::unexpected(make_error(ErrorCode::ProviderError, "model unavailable"));
    };
}

} // namespace mcpevals::testing
