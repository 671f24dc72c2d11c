#include "mcpevals/mcp/protocol.hpp"

namespace mcpevals::mcp {

auto make_request(int64_t id, std::string_view method, json params) -> json {
    json j = {
        {"jsonrpc", std::string(kJsonRpcVersion)},
        {"id", id},
        {"method", std::string(method)},
    };
    if (!params.is_null()) j["params"] = std::move(params);
    return j;
}

auto make_notification(std::string_view method, json params) -> json {
    json j = {
        {"jsonrpc", std::string(kJsonRpcVersion)},
        {"method", std::string(method)},
    };
    if (!params.is_null()) j["params"] = std::move(params);
    return j;
}

auto make_response(const json& id, json result) -> json {
    return json{{"jsonrpc", std::string(kJsonRpcVersion)}, {"id", id}, {"result", std::move(result)}};
}

auto make_error_response(const json& id, int code, std::string_view message) -> json {
    return json{
        {"jsonrpc", std::string(kJsonRpcVersion)},
        {"id", id},
        {"error", {{"code", code}, {"message", std::string(message)}}},
    };
}

auto response_error(const json& message) -> std::optional<Error> {
    auto it = message.find("error");
    if (it == message.end() || it->is_null()) return std::nullopt;

    std::string text = "Unknown error";
    std::string detail;
    if (it->is_object()) {
        text = it->value("message", text);
        if (it->contains("code")) detail = "code " + it->at("code").dump();
        if (it->contains("data")) {
            detail += detail.empty() ? "" : ", ";
            detail += it->at("data").dump();
        }
    } else if (it->is_string()) {
        text = it->get<std::string>();
    }
    return make_error(ErrorCode::ProtocolError, text, detail);
}

auto parse_tools(const json& result) -> Result<std::vector<Tool>> {
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return std::unexpected(make_error(ErrorCode::ProtocolError,
                                          "tools/list result has no tools array"));
    }

    std::vector<Tool> tools;
    for (const auto& t : result["tools"]) {
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) continue;
        Tool tool;
        tool.name = t["name"].get<std::string>();
        if (t.contains("description") && t["description"].is_string()) {
            tool.description = t["description"].get<std::string>();
        }
        if (t.contains("inputSchema") && t["inputSchema"].is_object()) {
            tool.input_schema = t["inputSchema"];
        }
        tools.push_back(std::move(tool));
    }
    return tools;
}

auto parse_call_result(const json& result) -> Result<ToolCallResult> {
    if (!result.is_object()) {
        return std::unexpected(make_error(ErrorCode::ProtocolError,
                                          "tools/call result is not an object"));
    }

    ToolCallResult out;
    if (result.contains("content") && result["content"].is_array()) {
        out.content = result["content"];
    }
    if (result.contains("isError") && result["isError"].is_boolean()) {
        out.is_error = result["isError"].get<bool>();
    }
    if (result.contains("structuredContent") && !result["structuredContent"].is_null()) {
        out.structured_content = result["structuredContent"];
    }
    return out;
}

} // namespace mcpevals::mcp
