#include <attachd/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

namespace attachd::mcp {

namespace {

spdlog::level::level_enum parseMcpLogLevel(const std::string& level) {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info" || level == "notice")
        return spdlog::level::info;
    if (level == "warning" || level == "warn")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    if (level == "critical" || level == "alert" || level == "emergency")
        return spdlog::level::critical;
    return spdlog::level::info;
}

} // namespace

std::optional<MessageResult>
MCPServer::dispatchCoreMethod(const json& id, const std::string& method, const json& params) {
    if (method == protocol::METHOD_INITIALIZE) {
        auto initResult = initialize(params);
        if (initResult.contains("_initialize_error")) {
            spdlog::error("MCP initialize failed: {}", initResult.value("message", ""));
            return MessageResult{json{{"jsonrpc", protocol::JSONRPC_VERSION},
                                      {"id", id},
                                      {"error",
                                       {{"code", initResult["code"]},
                                        {"message", initResult["message"]},
                                        {"data", initResult["data"]}}}}};
        }
        return MessageResult{createResponse(id, initResult)};
    }

    if (method == "notifications/cancelled") {
        json cancelId;
        if (params.contains("requestId")) {
            cancelId = params["requestId"];
        } else if (params.contains("id")) {
            cancelId = params["id"];
        } else {
            spdlog::warn("notifications/cancelled missing id/requestId");
            return MessageResult{Error{ErrorCode::InvalidArgument, "Missing id/requestId"}};
        }
        cancelRequest(cancelId);
        return MessageResult{Error{ErrorCode::Success, "notification"}};
    }

    if (method == "notifications/initialized") {
        clientInitialized_ = true;
        spdlog::debug("MCP client '{}' initialized", clientInfo_.name);
        return MessageResult{Error{ErrorCode::Success, "notification"}};
    }

    if (method == "ping") {
        return MessageResult{createResponse(id, json::object())};
    }

    if (method == "shutdown") {
        spdlog::debug("Shutdown request received, preparing for exit");
        shutdownRequested_ = true;
        return MessageResult{createResponse(id, json::object())};
    }

    if (method == "exit") {
        spdlog::debug("Exit request received");
        if (externalShutdown_)
            *externalShutdown_ = true;
        running_ = false;
        return MessageResult{Error{ErrorCode::Success, "notification"}};
    }

    if (method == protocol::METHOD_TOOLS_LIST) {
        return MessageResult{createResponse(id, listTools())};
    }

    if (method == protocol::METHOD_TOOLS_CALL) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return MessageResult{
                createError(id, protocol::INVALID_PARAMS, "tools/call requires a tool name")};
        }
        const auto toolName = params["name"].get<std::string>();
        auto toolArgs = params.value("arguments", json::object());
        if (toolArgs.is_null()) {
            toolArgs = json::object();
        }
        spdlog::debug("MCP tool call: '{}' with args: {}", toolName,
                      json_utils::dump_safe(toolArgs));
        return MessageResult{createResponse(id, callTool(toolName, toolArgs))};
    }

    if (method == "logging/setLevel") {
        const auto level = params.value("level", "info");
        spdlog::set_level(parseMcpLogLevel(level));
        return MessageResult{createResponse(id, json::object())};
    }

    return std::nullopt;
}

} // namespace attachd::mcp
