#pragma once

#include <nlohmann/json.hpp>
#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include <boost/asio/awaitable.hpp>
#include <attachd/core/types.h>

namespace attachd::mcp {

using json = nlohmann::json;

[[maybe_unused]] static nlohmann::json wrapToolResult(const nlohmann::json& structured) {
    nlohmann::json result;
    result["content"] = nlohmann::json::array(
        {nlohmann::json{{"type", "text"},
                        {"text", structured.dump(-1, ' ', false,
                                                 nlohmann::json::error_handler_t::replace)}}});
    return result;
}

// Tool failure as MCP content: {"content":[{"type":"text","text":"Error: ..."}],"isError":true}
[[maybe_unused]] static nlohmann::json wrapToolError(std::string_view text) {
    return nlohmann::json{
        {"content", nlohmann::json::array({nlohmann::json{{"type", "text"}, {"text", text}}})},
        {"isError", true}};
}

// "Error: <category>: <message>"
inline std::string formatToolError(const Error& error) {
    std::string text = "Error: ";
    text += errorToString(error.code);
    if (!error.message.empty()) {
        text += ": ";
        text += error.message;
    }
    return text;
}

// Thrown by DTO parsing when a required argument is missing or has the wrong type.
class ToolArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// C++20 concepts for tool system
template <typename T>
concept ToolRequest = requires {
    typename T::RequestType;
    requires std::same_as<T, typename T::RequestType>;
};

template <typename T>
concept ToolResponse = requires {
    typename T::ResponseType;
    requires std::same_as<T, typename T::ResponseType>;
};

template <typename T>
concept ToolSerializable = requires(const T& t, const json& j) {
    { T::fromJson(j) } -> std::same_as<T>;
    { t.toJson() } -> std::same_as<json>;
};

// Tool request/response DTOs

struct MCPStoreAttachmentRequest {
    using RequestType = MCPStoreAttachmentRequest;

    std::string attachmentId; // raw; validated by the handler

    static MCPStoreAttachmentRequest fromJson(const json& j);
    json toJson() const;
};

struct MCPStoreAttachmentResponse {
    using ResponseType = MCPStoreAttachmentResponse;

    std::string attachmentId;
    std::string filename;
    uint64_t size = 0;
    std::string contentType;
    bool fromCache = false;

    static MCPStoreAttachmentResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPStoreAndExtractRequest {
    using RequestType = MCPStoreAndExtractRequest;

    std::string attachmentId;

    static MCPStoreAndExtractRequest fromJson(const json& j);
    json toJson() const;
};

struct MCPStoreAndExtractResponse {
    using ResponseType = MCPStoreAndExtractResponse;

    static constexpr size_t kMaxFilesListed = 50;

    struct File {
        std::string path;
        uint64_t size = 0;
    };

    std::string attachmentId;
    std::string filename;
    bool extracted = false;
    size_t fileCount = 0;
    std::vector<File> files; // first kMaxFilesListed regular files
    bool fromCache = false;
    bool downloadFromCache = false;
    bool extractionFromCache = false;
    std::string message;

    static MCPStoreAndExtractResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPListFilesRequest {
    using RequestType = MCPListFilesRequest;

    std::string attachmentId;
    std::string pattern = "**/*";

    static MCPListFilesRequest fromJson(const json& j);
    json toJson() const;
};

struct MCPListFilesResponse {
    using ResponseType = MCPListFilesResponse;

    struct File {
        std::string path;
        std::string type = "file";
        std::optional<uint64_t> size;
    };

    std::string attachmentId;
    std::vector<File> files;

    static MCPListFilesResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPReadFileRequest {
    using RequestType = MCPReadFileRequest;

    std::string attachmentId;
    std::string path;
    int64_t offset = 0;
    int64_t limit = 2000;

    static MCPReadFileRequest fromJson(const json& j);
    json toJson() const;
};

struct MCPReadFileResponse {
    using ResponseType = MCPReadFileResponse;

    std::string attachmentId;
    std::string path;
    bool isBinary = false;
    // text
    std::string content;
    size_t linesReturned = 0;
    size_t totalLines = 0;
    bool hasMore = false;
    // binary
    std::string contentBase64;
    uint64_t size = 0;
    std::string contentType;

    static MCPReadFileResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPSearchFilesRequest {
    using RequestType = MCPSearchFilesRequest;

    std::string attachmentId;
    std::string pattern;
    std::string glob = "*";
    size_t contextLines = 2;
    size_t maxResults = 100;

    static MCPSearchFilesRequest fromJson(const json& j);
    json toJson() const;
};

struct MCPSearchFilesResponse {
    using ResponseType = MCPSearchFilesResponse;

    struct Match {
        std::string path;
        size_t line = 0;
        std::string content;
        std::vector<std::string> contextBefore;
        std::vector<std::string> contextAfter;
    };

    std::string attachmentId;
    std::vector<Match> matches;
    size_t totalMatches = 0;
    size_t filesSearched = 0;
    bool truncated = false;

    static MCPSearchFilesResponse fromJson(const json& j);
    json toJson() const;
};

struct MCPDeleteAttachmentRequest {
    using RequestType = MCPDeleteAttachmentRequest;

    std::string attachmentId;

    static MCPDeleteAttachmentRequest fromJson(const json& j);
    json toJson() const;
};

struct MCPDeleteAttachmentResponse {
    using ResponseType = MCPDeleteAttachmentResponse;

    std::string attachmentId;
    bool deleted = false;

    static MCPDeleteAttachmentResponse fromJson(const json& j);
    json toJson() const;
};

// Async tool wrapper template for coroutine-based handlers
template <ToolRequest RequestType, ToolResponse ResponseType>
requires ToolSerializable<RequestType> && ToolSerializable<ResponseType>
class AsyncToolWrapper {
public:
    using AsyncHandlerFn =
        std::function<boost::asio::awaitable<Result<ResponseType>>(const RequestType&)>;

    explicit AsyncToolWrapper(AsyncHandlerFn handler) : handler_(std::move(handler)) {}

    boost::asio::awaitable<json> operator()(const json& args) {
        try {
            auto req = RequestType::fromJson(args);
            auto result = co_await handler_(req);

            if (!result) {
                co_return wrapToolError(formatToolError(result.error()));
            }
            co_return wrapToolResult(result.value().toJson());

        } catch (const ToolArgumentError& e) {
            co_return wrapToolError(formatToolError(Error{ErrorCode::InvalidArgument, e.what()}));
        } catch (const json::exception& e) {
            co_return wrapToolError(formatToolError(Error{ErrorCode::InvalidArgument, e.what()}));
        } catch (const std::exception& e) {
            co_return wrapToolError(formatToolError(Error{ErrorCode::InternalError, e.what()}));
        }
    }

private:
    AsyncHandlerFn handler_;
};

// Async tool registry for coroutine-based handlers
class ToolRegistry {
public:
    using AsyncHandlerMap =
        std::unordered_map<std::string, std::function<boost::asio::awaitable<json>(const json&)>>;

    ToolRegistry() { handlers_.reserve(8); }

    template <ToolRequest RequestType, ToolResponse ResponseType>
    requires ToolSerializable<RequestType> && ToolSerializable<ResponseType>
    void registerTool(
        std::string_view name,
        std::function<boost::asio::awaitable<Result<ResponseType>>(const RequestType&)> handler,
        json schema = {}, std::string_view description = {}) {
        auto wrapper = AsyncToolWrapper<RequestType, ResponseType>(std::move(handler));
        auto handlerFn = [wrapper = std::move(wrapper)](
                             const json& args) mutable -> boost::asio::awaitable<json> {
            return wrapper(args);
        };

        auto [it, inserted] = handlers_.emplace(std::string(name), std::move(handlerFn));
        if (inserted) {
            descriptors_.push_back({it->first, std::move(schema), std::string(description)});
        }
    }

    boost::asio::awaitable<json> callTool(std::string_view name, const json& arguments) {
        if (auto it = handlers_.find(std::string(name)); it != handlers_.end()) {
            co_return co_await it->second(arguments);
        }
        co_return wrapToolError("Unknown tool: " + std::string(name));
    }

    json listTools() const {
        json tools = json::array();
        for (const auto& desc : descriptors_) {
            json tool;
            tool["name"] = desc.name;
            tool["description"] = desc.description;
            if (!desc.schema.empty()) {
                tool["inputSchema"] = desc.schema;
            }
            tools.push_back(std::move(tool));
        }
        return json{{"tools", std::move(tools)}};
    }

    bool hasTool(std::string_view name) const { return handlers_.contains(std::string(name)); }
    size_t size() const { return handlers_.size(); }

private:
    struct ToolDescriptor {
        std::string name;
        json schema;
        std::string description;
    };

    AsyncHandlerMap handlers_;
    std::vector<ToolDescriptor> descriptors_; // registration order
};

} // namespace attachd::mcp
