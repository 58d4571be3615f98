#pragma once

#include <nlohmann/json.hpp>
#include <attachd/core/types.h>

#include <string>
#include <string_view>

namespace attachd::mcp {

using json = nlohmann::json;

template <typename T> using MCPResult = Result<T>;

using JsonParseResult = MCPResult<json>;
using MessageResult = MCPResult<json>;

enum class TransportState : int {
    Disconnected = 0,
    Connected = 1,
    Error = 2,
    Closing = 3
};

namespace protocol {
constexpr std::string_view JSONRPC_VERSION = "2.0";
constexpr std::string_view METHOD_INITIALIZE = "initialize";
constexpr std::string_view METHOD_TOOLS_LIST = "tools/list";
constexpr std::string_view METHOD_TOOLS_CALL = "tools/call";

// JSON-RPC 2.0 error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
} // namespace protocol

namespace json_utils {

inline JsonParseResult parse_json(std::string_view input) noexcept {
    if (input.empty()) {
        return Error{ErrorCode::InvalidData, "Empty input string for JSON parsing"};
    }
    try {
        return json::parse(input);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parse error: ") + e.what() +
                                                 " at position " + std::to_string(e.byte)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON parsing failed: ") + e.what()};
    }
}

// Checks a single request object; batches are split by the caller.
inline MCPResult<json> validate_jsonrpc_message(const json& msg) noexcept {
    if (!msg.is_object()) {
        return Error{ErrorCode::InvalidData, "Message must be a JSON object"};
    }
    auto it = msg.find("jsonrpc");
    if (it == msg.end() || !it->is_string() || it->get<std::string>() != protocol::JSONRPC_VERSION) {
        return Error{ErrorCode::InvalidData, "Invalid or missing jsonrpc version"};
    }
    auto m = msg.find("method");
    if (m == msg.end() || !m->is_string()) {
        return Error{ErrorCode::InvalidData, "Missing 'method' field"};
    }
    return msg;
}

// Serialize for the wire; invalid UTF-8 from file content is replaced, never thrown.
inline std::string dump_safe(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace json_utils

} // namespace attachd::mcp
