#include <attachd/mcp/mcp_server.h>

#include <spdlog/spdlog.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>

#include <csignal>
#include <exception>
#include <future>

namespace attachd::mcp {

thread_local std::shared_ptr<std::atomic<bool>> MCPServer::tlsCancelToken_;

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, cache::AttachmentCache& cache,
                     upstream::FetchFn fetch, MCPServerOptions options,
                     std::atomic<bool>* externalShutdown)
    : transport_(std::move(transport)),
      cache_(cache),
      fetch_(std::move(fetch)),
      options_(options),
      externalShutdown_(externalShutdown),
      toolRegistry_(std::make_unique<ToolRegistry>()) {
    if (options_.workerThreads == 0) {
        options_.workerThreads = 1;
    }
    workers_ = std::make_unique<boost::asio::thread_pool>(options_.workerThreads);
    registerAttachmentTools();
}

MCPServer::~MCPServer() {
    stop();
}

void MCPServer::sendResponse(const json& message) {
    if (!transport_) {
        return;
    }
    try {
        transport_->send(message);
    } catch (const std::exception& e) {
        spdlog::error("MCP sendResponse failed: {}", e.what());
    }
}

void MCPServer::start() {
    if (running_.exchange(true)) {
        return; // Already running
    }
#ifndef _WIN32
    // Prevent abrupt termination on first write if the client side is not yet reading
    std::signal(SIGPIPE, SIG_IGN);
#endif

    spdlog::info("MCP server started ({} worker threads)", options_.workerThreads);

    try {
        while (running_ && (!externalShutdown_ || !*externalShutdown_)) {
            auto messageResult = transport_->receive();

            if (!messageResult) {
                const auto& error = messageResult.error();
                switch (error.code) {
                    case ErrorCode::NetworkError:
                        spdlog::debug("Transport closed: {}", error.message);
                        running_ = false;
                        break;

                    case ErrorCode::InvalidData:
                        spdlog::debug("Invalid JSON received: {}", error.message);
                        // Per JSON-RPC 2.0, respond with Parse error and id=null
                        sendResponse(
                            createError(json(nullptr), protocol::PARSE_ERROR, error.message));
                        continue;

                    default:
                        spdlog::error("Unexpected transport error: {}", error.message);
                        continue;
                }
                continue;
            }

            auto message = std::move(messageResult).value();
            auto processRequest = [this](const json& request) {
                auto valid = json_utils::validate_jsonrpc_message(request);
                if (!valid) {
                    spdlog::warn("MCP server rejected message: {}", valid.error().message);
                    json id = request.is_object() ? request.value("id", json(nullptr)) : json();
                    this->sendResponse(
                        createError(id, protocol::INVALID_REQUEST, valid.error().message));
                    return;
                }

                spdlog::debug("MCP server received message: {}", json_utils::dump_safe(request));

                if (!request.contains("id")) {
                    (void)this->handleRequest(request);
                    return;
                }

                auto id = request["id"];
                auto token = this->registerCancelable(id);
                this->enqueueTask([this, req = request, id, token]() {
                    tlsCancelToken_ = token;
                    auto response = this->handleRequest(req);
                    tlsCancelToken_.reset();
                    if (this->isCanceled(id)) {
                        spdlog::debug("Dropping response for cancelled request id={}", id.dump());
                    } else if (response) {
                        this->sendResponse(response.value());
                    } else if (response.error().code != ErrorCode::Success) {
                        this->sendResponse(createError(id, protocol::INTERNAL_ERROR,
                                                       response.error().message));
                    }
                    this->forgetCancelable(id);
                });
            };

            if (message.is_array()) {
                if (message.empty()) {
                    sendResponse(createError(json(nullptr), protocol::INVALID_REQUEST,
                                             "Empty JSON-RPC batch"));
                }
                for (const auto& entry : message) {
                    processRequest(entry);
                }
            } else {
                processRequest(message);
            }
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal exception in MCPServer::start: {}", e.what());
    }

    running_ = false;
    drainWorkers();
    spdlog::info("MCP server stopped");
}

void MCPServer::stop() {
    running_.store(false);
    drainWorkers();
    if (transport_) {
        transport_->close();
    }
}

void MCPServer::enqueueTask(std::function<void()> task) {
    std::lock_guard<std::mutex> lk(workersMutex_);
    if (!workers_) {
        workers_ = std::make_unique<boost::asio::thread_pool>(options_.workerThreads);
    }
    boost::asio::post(*workers_, [task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("MCP worker task failed: {}", e.what());
        }
    });
}

// Waits for queued requests so their responses are written before shutdown.
void MCPServer::drainWorkers() {
    std::unique_ptr<boost::asio::thread_pool> pool;
    {
        std::lock_guard<std::mutex> lk(workersMutex_);
        pool = std::move(workers_);
    }
    if (pool) {
        pool->join();
    }
}

MessageResult MCPServer::handleRequest(const json& request) {
    auto id = request.value("id", json{});
    try {
        std::string method = request.value("method", "");
        json params = request.value("params", json::object());

        if (auto handled = dispatchCoreMethod(id, method, params)) {
            return std::move(*handled);
        }

        if (!request.contains("id")) {
            // Unknown notifications are ignored per JSON-RPC
            spdlog::debug("Ignoring unknown notification '{}'", method);
            return Error{ErrorCode::Success, "notification"};
        }
        return createError(id, protocol::METHOD_NOT_FOUND, "Method not found: " + method);
    } catch (const json::exception& e) {
        return createError(id, protocol::INVALID_PARAMS, std::string("Invalid params: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("MCP request failed: {}", e.what());
        return createError(id, protocol::INTERNAL_ERROR, e.what());
    }
}

json MCPServer::callTool(const std::string& name, const json& arguments) {
    spdlog::info("MCP callTool invoked: name='{}'", name);

    // Each call gets its own io_context so a worker never waits on the pool it runs in.
    boost::asio::io_context ioc;
    auto future =
        boost::asio::co_spawn(ioc, toolRegistry_->callTool(name, arguments), boost::asio::use_future);
    ioc.run();

    try {
        json result = future.get();
        if (result.value("isError", false)) {
            spdlog::warn("MCP tool '{}' failed: {}", name,
                         result["content"][0].value("text", std::string{}));
        }
        return result;
    } catch (const std::exception& e) {
        spdlog::error("MCP tool '{}' threw exception: {}", name, e.what());
        return wrapToolError(formatToolError(Error{ErrorCode::InternalError, e.what()}));
    }
}

json MCPServer::createResponse(const json& id, const json& result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json MCPServer::createError(const json& id, int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

json MCPServer::buildServerCapabilities() const {
    return json{{"tools", {{"listChanged", false}}}, {"logging", json::object()}};
}

// Cancellation tokens are keyed by the request id (string ids verbatim, others dumped).

std::shared_ptr<std::atomic<bool>> MCPServer::registerCancelable(const json& id) {
    if (id.is_null())
        return nullptr;
    std::lock_guard<std::mutex> lk(cancelMutex_);
    std::string key = id.is_string() ? id.get<std::string>() : id.dump();
    auto& token = cancelTokens_[key];
    if (!token) {
        token = std::make_shared<std::atomic<bool>>(false);
    }
    return token;
}

void MCPServer::cancelRequest(const json& id) {
    if (id.is_null())
        return;
    std::lock_guard<std::mutex> lk(cancelMutex_);
    std::string key = id.is_string() ? id.get<std::string>() : id.dump();
    auto it = cancelTokens_.find(key);
    if (it != cancelTokens_.end()) {
        it->second->store(true);
        spdlog::info("Cancel requested for id '{}'", key);
    }
}

bool MCPServer::isCanceled(const json& id) const {
    if (id.is_null())
        return false;
    std::lock_guard<std::mutex> lk(cancelMutex_);
    std::string key = id.is_string() ? id.get<std::string>() : id.dump();
    auto it = cancelTokens_.find(key);
    if (it == cancelTokens_.end())
        return false;
    return it->second->load();
}

void MCPServer::forgetCancelable(const json& id) {
    if (id.is_null())
        return;
    std::lock_guard<std::mutex> lk(cancelMutex_);
    cancelTokens_.erase(id.is_string() ? id.get<std::string>() : id.dump());
}

} // namespace attachd::mcp
