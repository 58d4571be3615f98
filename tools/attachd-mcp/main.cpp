#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <CLI/CLI.hpp>

#include <attachd/cache/attachment_cache.h>
#include <attachd/config/attachd_config.h>
#include <attachd/mcp/mcp_server.h>
#include <attachd/upstream/zendesk_fetcher.h>
#include <attachd/version.hpp>

std::atomic<bool> g_shutdown{false};

void signalHandler(int) {
    g_shutdown = true;
}

int main(int argc, char* argv[]) {
    CLI::App app{"attachd MCP server - cache, extract and search Zendesk attachments"};

    std::string log_level = "info";
    std::string log_file;
    std::string config_path;
    std::string cache_dir;
    size_t workers = 4;

    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))
        ->default_val("info");
    app.add_option("--log-file", log_file, "Rotating log file path (optional)");
    app.add_option("--config", config_path, "Config file (default: $ATTACHD_CONFIG or "
                                            "~/.config/attachd/config.toml)");
    app.add_option("--cache-dir", cache_dir, "Cache root (overrides ZENDESK_ATTACHMENT_CACHE_DIR)");
    app.add_option("--workers", workers, "Worker threads for tool calls")
        ->check(CLI::Range(1, 64))
        ->default_val(4);
    app.set_version_flag("--version", ATTACHD_VERSION_STRING);
    CLI11_PARSE(app, argc, argv);

    try {
        // stdout carries the protocol; logs go to stderr
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 10 * 1024 * 1024, 3));
        }
        auto logger = std::make_shared<spdlog::logger>("attachd-mcp", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);

        if (log_level == "trace")
            spdlog::set_level(spdlog::level::trace);
        else if (log_level == "debug")
            spdlog::set_level(spdlog::level::debug);
        else if (log_level == "warn")
            spdlog::set_level(spdlog::level::warn);
        else if (log_level == "error")
            spdlog::set_level(spdlog::level::err);
        else
            spdlog::set_level(spdlog::level::info);

        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    spdlog::info("attachd MCP server v{}", ATTACHD_VERSION_STRING);

    auto cfg = attachd::config::loadConfig(config_path);
    if (!cache_dir.empty()) {
        cfg.cacheDir = cache_dir;
    }

    attachd::cache::CacheOptions options;
    options.root = cfg.cacheDir;
    options.extract.maxTotalBytes = cfg.extractMaxTotalBytes;
    options.extract.maxEntries = cfg.extractMaxEntries;
    options.extract.timeout = cfg.extractTimeout;
    options.extract.shouldCancel = [] { return g_shutdown.load(); };
    options.read.maxInlineBinaryBytes = cfg.readerMaxInlineBinaryBytes;
    options.eviction =
        attachd::cache::makeEvictionPolicy(cfg.evictionMaxTotalBytes, cfg.evictionMaxAgeHours);

    auto cache = attachd::cache::AttachmentCache::open(std::move(options));
    if (!cache) {
        spdlog::critical("Cannot open attachment cache: {}", cache.error().message);
        return 1;
    }
    auto attachmentCache = std::move(cache).value();

    if (!cfg.zendesk.hasCredentials()) {
        spdlog::warn("Zendesk credentials not configured; only cached attachments are available");
    }
    auto fetcher = std::make_shared<attachd::upstream::ZendeskAttachmentFetcher>(cfg.zendesk);
    attachd::upstream::FetchFn fetch = [fetcher](const attachd::cache::AttachmentId& id) {
        return fetcher->fetch(id);
    };

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        attachd::mcp::MCPServerOptions serverOptions;
        serverOptions.workerThreads = workers;
        auto server = std::make_unique<attachd::mcp::MCPServer>(
            std::make_unique<attachd::mcp::StdioTransport>(), *attachmentCache, fetch,
            serverOptions, &g_shutdown);

        std::atomic<bool> serverDone{false};
        std::thread server_thread([&server, &serverDone]() {
            server->start();
            serverDone = true;
        });

        while (!g_shutdown && !serverDone) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        // `exit` raises g_shutdown from inside the loop; let it finish on its own.
        for (int i = 0; i < 10 && !serverDone; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (serverDone) {
            server_thread.join();
            spdlog::info("MCP server stopped");
            return 0;
        }

        // Signalled: the reader thread may be blocked on stdin indefinitely.
        spdlog::info("Shutting down MCP server...");
        server->stop();
        spdlog::shutdown();
        std::_Exit(0);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
