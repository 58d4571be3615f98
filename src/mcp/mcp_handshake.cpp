#include <attachd/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <vector>

namespace attachd::mcp {

// Custom server error for protocol negotiation failures in strict mode
static constexpr int kErrUnsupportedProtocolVersion = -32901;

json MCPServer::initialize(const json& params) {
    static const std::vector<std::string> kSupported = {"2025-11-25", "2025-06-18", "2025-03-26",
                                                        "2024-11-05", "2024-10-07"};
    const std::string latest = "2025-11-25";

    std::string requested = latest;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        requested = params["protocolVersion"].get<std::string>();
    }
    spdlog::debug("MCP client requested protocol version: {}", requested);

    // Negotiate (fallback to latest if unsupported)
    std::string negotiated = latest;
    bool matched = std::find(kSupported.begin(), kSupported.end(), requested) != kSupported.end();
    if (matched) {
        negotiated = requested;
    } else if (options_.strictProtocol) {
        json error_data = {{"supportedVersions", kSupported}};
        return {{"_initialize_error", true},
                {"code", kErrUnsupportedProtocolVersion},
                {"message", "Unsupported protocol version requested by client"},
                {"data", error_data}};
    }

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        clientInfo_.name = params["clientInfo"].value("name", "unknown");
        clientInfo_.version = params["clientInfo"].value("version", "unknown");
    }

    negotiatedProtocolVersion_ = negotiated;
    spdlog::info("MCP initialize from {} {} (protocol {})", clientInfo_.name, clientInfo_.version,
                 negotiated);

    return {{"protocolVersion", negotiated},
            {"serverInfo", {{"name", serverInfo_.name}, {"version", serverInfo_.version}}},
            {"capabilities", buildServerCapabilities()},
            {"_meta", {{"cacheRoot", cache_.rootPath().string()}}}};
}

} // namespace attachd::mcp
