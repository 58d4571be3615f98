#pragma once

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp
#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>
#include <attachd/cache/attachment_cache.h>
#include <attachd/core/types.h>
#include <attachd/mcp/error_handling.h>
#include <attachd/mcp/tool_registry.h>
#include <attachd/upstream/attachment_fetcher.h>
#include <attachd/version.hpp>

#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace attachd::mcp {

using json = nlohmann::json;

/**
 * Transport interface for MCP communication
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual void send(const json& message) = 0;
    virtual MessageResult receive() = 0;
    virtual bool isConnected() const = 0;
    virtual void close() = 0;
    virtual TransportState getState() const = 0;
};

/**
 * Standard I/O transport speaking newline-delimited JSON (one message per line).
 * receive() blocks on the input stream; EOF reports NetworkError and leaves the
 * transport Disconnected. Output stays writable until close() so responses to
 * in-flight requests are still delivered after the client stops sending.
 */
class StdioTransport : public ITransport {
public:
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    void send(const json& message) override;
    MessageResult receive() override;
    bool isConnected() const override { return state_.load() == TransportState::Connected; }
    void close() override { state_.store(TransportState::Closing); }
    TransportState getState() const override { return state_.load(); }

private:
    std::istream& in_;
    std::ostream& out_;

    std::atomic<TransportState> state_{TransportState::Connected};
    std::atomic<size_t> errorCount_{0};

    // Serializes writes from worker threads
    mutable std::mutex outMutex_;

    bool shouldRetryAfterError() const noexcept;
    void recordError() noexcept;
    void resetErrorCount() noexcept;
};

struct MCPServerOptions {
    size_t workerThreads = 4;
    // Reject initialize with an unknown protocolVersion instead of falling back to latest.
    bool strictProtocol = false;
};

/**
 * MCP server exposing the attachment cache as tools.
 *
 * Requests are read on the calling thread; each request that expects a response runs
 * on a worker pool and its response is written as soon as it is ready, so responses
 * may be delivered out of order. Notifications are handled inline.
 */
class MCPServer {
public:
    MCPServer(std::unique_ptr<ITransport> transport, cache::AttachmentCache& cache,
              upstream::FetchFn fetch, MCPServerOptions options = {},
              std::atomic<bool>* externalShutdown = nullptr);
    ~MCPServer();

    MCPServer(const MCPServer&) = delete;
    MCPServer& operator=(const MCPServer&) = delete;

    // Runs the receive loop until EOF, `exit`, or stop(). Pending responses are flushed
    // before returning.
    void start();
    void stop();
    bool isRunning() const { return running_.load(); }
    bool isShutdownRequested() const { return shutdownRequested_.load(); }

    // Handle one JSON-RPC request object. Notifications yield
    // Error{ErrorCode::Success, "notification"} (nothing to send).
    MessageResult handleRequest(const json& request);

    // Run a tool to completion and return the MCP tool result object.
    json callTool(const std::string& name, const json& arguments);
    json listTools() const { return toolRegistry_->listTools(); }

    const std::string& negotiatedProtocolVersion() const { return negotiatedProtocolVersion_; }

    static json createResponse(const json& id, const json& result);
    static json createError(const json& id, int code, const std::string& message);

private:
    std::optional<MessageResult> dispatchCoreMethod(const json& id, const std::string& method,
                                                    const json& params);
    json initialize(const json& params);
    json buildServerCapabilities() const;
    void registerAttachmentTools();

    void sendResponse(const json& message);
    void enqueueTask(std::function<void()> task);
    void drainWorkers();

    std::shared_ptr<std::atomic<bool>> registerCancelable(const json& id);
    void cancelRequest(const json& id);
    bool isCanceled(const json& id) const;
    void forgetCancelable(const json& id);

    // Tool handlers
    boost::asio::awaitable<Result<MCPStoreAttachmentResponse>>
    handleStoreAttachment(const MCPStoreAttachmentRequest& req);
    boost::asio::awaitable<Result<MCPStoreAndExtractResponse>>
    handleStoreAndExtract(const MCPStoreAndExtractRequest& req);
    boost::asio::awaitable<Result<MCPListFilesResponse>>
    handleListFiles(const MCPListFilesRequest& req);
    boost::asio::awaitable<Result<MCPReadFileResponse>>
    handleReadFile(const MCPReadFileRequest& req);
    boost::asio::awaitable<Result<MCPSearchFilesResponse>>
    handleSearchFiles(const MCPSearchFilesRequest& req);
    boost::asio::awaitable<Result<MCPDeleteAttachmentResponse>>
    handleDeleteAttachment(const MCPDeleteAttachmentRequest& req);

    std::unique_ptr<ITransport> transport_;
    cache::AttachmentCache& cache_;
    upstream::FetchFn fetch_;
    MCPServerOptions options_;
    std::atomic<bool>* externalShutdown_;

    std::unique_ptr<ToolRegistry> toolRegistry_;
    std::unique_ptr<boost::asio::thread_pool> workers_;
    std::mutex workersMutex_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdownRequested_{false};
    std::atomic<bool> clientInitialized_{false};

    struct {
        std::string name = "attachd";
        std::string version = ATTACHD_VERSION_STRING;
    } serverInfo_;
    struct {
        std::string name = "unknown";
        std::string version = "unknown";
    } clientInfo_;
    std::string negotiatedProtocolVersion_;

    // Cancel token of the request running on this worker thread, if any.
    static thread_local std::shared_ptr<std::atomic<bool>> tlsCancelToken_;

    mutable std::mutex cancelMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::atomic<bool>>> cancelTokens_;
};

} // namespace attachd::mcp
