#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "mcpevals/core/error.hpp"

namespace mcpevals::mcp {

using json = nlohmann::json;

inline constexpr std::string_view kProtocolVersion = "2024-11-05";
inline constexpr std::string_view kJsonRpcVersion = "2.0";

/// A tool advertised by a server.
struct Tool {
    std::string name;
    std::string description;
    json input_schema = json::object();
};

/// Result of tools/call: content blocks plus the server's error flag.
struct ToolCallResult {
    json content = json::array();
    bool is_error = false;
    std::optional<json> structured_content;
};

auto make_request(int64_t id, std::string_view method, json params = nullptr) -> json;
auto make_notification(std::string_view method, json params = nullptr) -> json;
auto make_response(const json& id, json result) -> json;
auto make_error_response(const json& id, int code, std::string_view message) -> json;

/// A JSON-RPC error object in `message` converted to an Error, if present.
auto response_error(const json& message) -> std::optional<Error>;

/// Parses a tools/list result.
auto parse_tools(const json& result) -> Result<std::vector<Tool>>;

/// Parses a tools/call result.
auto parse_call_result(const json& result) -> Result<ToolCallResult>;

} // namespace mcpevals::mcp
