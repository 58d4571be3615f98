#include <catch2/catch_test_macros.hpp>

#include <attachd/mcp/mcp_server.h>

#include "../../common/archive_fixtures.h"
#include "../../common/test_helpers_catch2.h"

#include <chrono>
#include <map>
#include <set>
#include <sstream>

using attachd::ErrorCode;
using attachd::cache::AttachmentCache;
using attachd::cache::CacheOptions;
using attachd::mcp::MCPServer;
using attachd::mcp::StdioTransport;
using attachd::test::ArchiveMember;
using attachd::test::CountingFetcher;
using attachd::test::TempDir;
using attachd::test::TestArchiveFormat;
using json = nlohmann::json;

namespace {

struct ServerFixture {
    TempDir dir;
    CountingFetcher upstream;
    std::unique_ptr<AttachmentCache> cache;
    std::istringstream in;
    std::ostringstream out;
    std::unique_ptr<MCPServer> server;

    ServerFixture() {
        CacheOptions opts;
        opts.root = dir.path() / "cache";
        auto opened = AttachmentCache::open(std::move(opts));
        REQUIRE(opened);
        cache = std::move(opened).value();
        server = std::make_unique<MCPServer>(std::make_unique<StdioTransport>(in, out), *cache,
                                             upstream.fn());
    }

    json request(const json& id, const std::string& method, const json& params = json::object()) {
        auto r = server->handleRequest(
            json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});
        REQUIRE(r);
        return std::move(r).value();
    }

    // Calls a tool and returns {isError, payload}; payload is parsed JSON on success.
    std::pair<bool, json> tool(const std::string& name, const json& args) {
        auto result = server->callTool(name, args);
        const bool isError = result.value("isError", false);
        const auto text = result["content"][0]["text"].get<std::string>();
        if (isError) {
            return {true, json(text)};
        }
        return {false, json::parse(text)};
    }
};

} // namespace

TEST_CASE_METHOD(ServerFixture, "MCP initialize and core methods", "[mcp][server][catch2]") {
    auto init = request(1, "initialize",
                        {{"protocolVersion", "2024-11-05"},
                         {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}}});
    CHECK(init["id"] == 1);
    CHECK(init["result"]["protocolVersion"] == "2024-11-05");
    CHECK(init["result"]["serverInfo"]["name"] == "attachd");
    CHECK(init["result"]["capabilities"].contains("tools"));
    CHECK(server->negotiatedProtocolVersion() == "2024-11-05");

    auto fallback = request(2, "initialize", {{"protocolVersion", "1999-01-01"}});
    CHECK(fallback["result"]["protocolVersion"] == "2025-11-25");

    auto ping = request("p", "ping");
    CHECK(ping["id"] == "p");
    CHECK(ping["result"] == json::object());

    auto unknown = request(3, "resources/list");
    CHECK(unknown["error"]["code"] == -32601);

    auto note = server->handleRequest(
        json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    REQUIRE_FALSE(note);
    CHECK(note.error().code == ErrorCode::Success);

    auto missingName = request(4, "tools/call", {{"arguments", json::object()}});
    CHECK(missingName["error"]["code"] == -32602);
}

TEST_CASE("MCP strict protocol negotiation rejects unknown versions", "[mcp][server][catch2]") {
    TempDir dir;
    CacheOptions opts;
    opts.root = dir.path() / "cache";
    auto cache = AttachmentCache::open(std::move(opts));
    REQUIRE(cache);
    std::istringstream in;
    std::ostringstream out;
    attachd::mcp::MCPServerOptions serverOpts;
    serverOpts.strictProtocol = true;
    MCPServer server(std::make_unique<StdioTransport>(in, out), *cache.value(), nullptr,
                     serverOpts);

    auto r = server.handleRequest(json{{"jsonrpc", "2.0"},
                                       {"id", 1},
                                       {"method", "initialize"},
                                       {"params", {{"protocolVersion", "1999-01-01"}}}});
    REQUIRE(r);
    CHECK(r.value()["error"]["code"] == -32901);
}

TEST_CASE_METHOD(ServerFixture, "tools/list exposes the attachment tools", "[mcp][server][catch2]") {
    auto listed = request(1, "tools/list");
    const auto& tools = listed["result"]["tools"];
    std::set<std::string> names;
    for (const auto& t : tools) {
        names.insert(t["name"].get<std::string>());
        CHECK(t["inputSchema"]["type"] == "object");
        CHECK_FALSE(t["description"].get<std::string>().empty());
    }
    CHECK(names == std::set<std::string>{"store_attachment", "store_and_extract_attachment",
                                         "list_attachment_files", "read_attachment_file",
                                         "search_attachment_files", "delete_cached_attachment"});
}

TEST_CASE_METHOD(ServerFixture, "Attachment tools end to end", "[mcp][server][catch2]") {
    std::string log;
    for (int i = 1; i <= 30; ++i) {
        log += (i % 10 == 0 ? "ERROR tick " : "INFO tick ") + std::to_string(i) + "\n";
    }
    upstream.add("1001", {attachd::test::write_archive(
                              dir.path() / "logs.zip",
                              {ArchiveMember::file("app/server.log", log),
                               ArchiveMember::file("README.txt", "read me\n")},
                              TestArchiveFormat::Zip),
                          "logs.zip", "application/zip"});

    auto [extractErr, extracted] =
        tool("store_and_extract_attachment", {{"attachment_id", 1001}});
    REQUIRE_FALSE(extractErr);
    CHECK(extracted["attachment_id"] == "1001");
    CHECK(extracted["extracted"] == true);
    CHECK(extracted["file_count"] == 2);
    CHECK(extracted["files"].size() == 2);
    CHECK(extracted["from_cache"] == false);

    auto [listErr, listed] =
        tool("list_attachment_files", {{"attachment_id", "1001"}, {"pattern", "**/*.log"}});
    REQUIRE_FALSE(listErr);
    REQUIRE(listed["files"].size() == 1);
    CHECK(listed["files"][0]["path"] == "app/server.log");
    CHECK(listed["files"][0]["type"] == "file");

    auto [readErr, read] = tool("read_attachment_file", {{"attachment_id", 1001},
                                                         {"path", "app/server.log"},
                                                         {"offset", 5},
                                                         {"limit", 2}});
    REQUIRE_FALSE(readErr);
    CHECK(read["is_binary"] == false);
    CHECK(read["content"] == "6\tINFO tick 6\n7\tINFO tick 7");
    CHECK(read["lines_returned"] == 2);
    CHECK(read["total_lines"] == 30);
    CHECK(read["has_more"] == true);

    auto [searchErr, found] = tool("search_attachment_files", {{"attachment_id", 1001},
                                                               {"pattern", "^ERROR"},
                                                               {"context_lines", 0},
                                                               {"max_results", 2}});
    REQUIRE_FALSE(searchErr);
    CHECK(found["total_matches"] == 3);
    CHECK(found["matches"].size() == 2);
    CHECK(found["truncated"] == true);
    CHECK(found["matches"][0]["line"] == 10);

    auto [againErr, again] = tool("store_attachment", {{"attachment_id", 1001}});
    REQUIRE_FALSE(againErr);
    CHECK(again["from_cache"] == true);
    CHECK(upstream.calls() == 1);

    auto [delErr, deleted] = tool("delete_cached_attachment", {{"attachment_id", 1001}});
    REQUIRE_FALSE(delErr);
    CHECK(deleted["deleted"] == true);

    auto [goneErr, gone] = tool("list_attachment_files", {{"attachment_id", 1001}});
    CHECK(goneErr);
    CHECK(gone.get<std::string>().starts_with("Error: Not found"));
}

TEST_CASE_METHOD(ServerFixture, "Tool failures are reported as tool errors",
                 "[mcp][server][catch2]") {
    upstream.add("1002", {"plain text\n", "notes.txt", "text/plain"});

    SECTION("path escape") {
        REQUIRE_FALSE(tool("store_attachment", {{"attachment_id", 1002}}).first);
        auto [isError, text] =
            tool("read_attachment_file", {{"attachment_id", 1002}, {"path", "../metadata.json"}});
        CHECK(isError);
        CHECK(text.get<std::string>().starts_with("Error: Invalid path"));
    }

    SECTION("upstream failure") {
        auto [isError, text] = tool("store_attachment", {{"attachment_id", 4040}});
        CHECK(isError);
        CHECK(text.get<std::string>().starts_with("Error: Upstream fetch error"));
    }

    SECTION("unsafe id") {
        auto [isError, text] = tool("store_attachment", {{"attachment_id", "../../etc"}});
        CHECK(isError);
        CHECK(text.get<std::string>().starts_with("Error: Invalid path"));
        CHECK(upstream.calls() == 0);
    }

    SECTION("non-archive extraction is not an error") {
        auto [isError, payload] = tool("store_and_extract_attachment", {{"attachment_id", 1002}});
        REQUIRE_FALSE(isError);
        CHECK(payload["extracted"] == false);
        CHECK(payload["message"].get<std::string>().find("read_attachment_file") !=
              std::string::npos);
    }

    SECTION("tools/call wraps tool errors in a successful response") {
        auto response = request(9, "tools/call",
                                {{"name", "search_attachment_files"},
                                 {"arguments", {{"attachment_id", 1002}, {"pattern", "("}}}});
        CHECK_FALSE(response.contains("error"));
        CHECK(response["result"]["isError"] == true);
    }
}

TEST_CASE_METHOD(ServerFixture, "notifications/cancelled stops an in-flight extraction",
                 "[mcp][server][cancel][catch2]") {
    upstream.add("1003", {attachd::test::write_archive(
                              dir.path() / "bundle.tar.gz",
                              {ArchiveMember::file("a.log", "1\n"), ArchiveMember::file("b.log", "2\n")},
                              TestArchiveFormat::TarGz),
                          "bundle.tar.gz", "application/gzip"});
    // Keeps the worker in the download while the reader handles the cancellation.
    upstream.setDelay(std::chrono::milliseconds(200));

    const json call{{"jsonrpc", "2.0"},
                    {"id", 7},
                    {"method", "tools/call"},
                    {"params",
                     {{"name", "store_and_extract_attachment"},
                      {"arguments", {{"attachment_id", 1003}}}}}};
    const json cancel{{"jsonrpc", "2.0"},
                      {"method", "notifications/cancelled"},
                      {"params", {{"requestId", 7}}}};
    in.str(call.dump() + "\n" + cancel.dump() + "\n");

    server->start();

    CHECK(upstream.calls() == 1);
    CHECK(cache->store().exists("1003"));
    CHECK_FALSE(cache->store().isExtracted("1003"));
    // The cancelled request gets no response.
    CHECK(out.str().empty());
}
