#include <attachd/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <vector>

namespace attachd::mcp {

namespace {

json attachmentIdSchema() {
    return json{{"type", json::array({"integer", "string"})},
                {"description", "Zendesk attachment ID"}};
}

json objectSchema(json properties, std::vector<std::string> required) {
    return json{{"type", "object"}, {"properties", std::move(properties)}, {"required", required}};
}

} // namespace

void MCPServer::registerAttachmentTools() {
    toolRegistry_->registerTool<MCPStoreAttachmentRequest, MCPStoreAttachmentResponse>(
        "store_attachment",
        [this](const MCPStoreAttachmentRequest& req) { return handleStoreAttachment(req); },
        objectSchema({{"attachment_id", attachmentIdSchema()}}, {"attachment_id"}),
        "Download a Zendesk attachment into the local cache. Repeated calls are served from "
        "the cache without contacting Zendesk.");

    toolRegistry_->registerTool<MCPStoreAndExtractRequest, MCPStoreAndExtractResponse>(
        "store_and_extract_attachment",
        [this](const MCPStoreAndExtractRequest& req) { return handleStoreAndExtract(req); },
        objectSchema({{"attachment_id", attachmentIdSchema()}}, {"attachment_id"}),
        "Download a Zendesk attachment and extract it when it is an archive (zip, tar, tar.gz, "
        "tgz, tar.bz2, tbz2). Returns the first 50 extracted files.");

    toolRegistry_->registerTool<MCPListFilesRequest, MCPListFilesResponse>(
        "list_attachment_files",
        [this](const MCPListFilesRequest& req) { return handleListFiles(req); },
        objectSchema({{"attachment_id", attachmentIdSchema()},
                      {"pattern",
                       {{"type", "string"},
                        {"description", "Glob over relative paths; ** spans directories"},
                        {"default", "**/*"}}}},
                     {"attachment_id"}),
        "List files of a cached attachment (extracted contents when available).");

    toolRegistry_->registerTool<MCPReadFileRequest, MCPReadFileResponse>(
        "read_attachment_file",
        [this](const MCPReadFileRequest& req) { return handleReadFile(req); },
        objectSchema(
            {{"attachment_id", attachmentIdSchema()},
             {"path", {{"type", "string"}, {"description", "Path relative to the attachment"}}},
             {"offset",
              {{"type", "integer"}, {"description", "Lines to skip"}, {"default", 0}}},
             {"limit",
              {{"type", "integer"}, {"description", "Maximum lines"}, {"default", 2000}}}},
            {"attachment_id", "path"}),
        "Read a file from a cached attachment with line numbers. Binary files are returned "
        "as base64.");

    toolRegistry_->registerTool<MCPSearchFilesRequest, MCPSearchFilesResponse>(
        "search_attachment_files",
        [this](const MCPSearchFilesRequest& req) { return handleSearchFiles(req); },
        objectSchema({{"attachment_id", attachmentIdSchema()},
                      {"pattern", {{"type", "string"}, {"description", "Regular expression"}}},
                      {"glob",
                       {{"type", "string"},
                        {"description", "File filter; matches file names unless it contains /"},
                        {"default", "*"}}},
                      {"context_lines", {{"type", "integer"}, {"default", 2}}},
                      {"max_results", {{"type", "integer"}, {"default", 100}}}},
                     {"attachment_id", "pattern"}),
        "Search the text files of a cached attachment with a regular expression.");

    toolRegistry_->registerTool<MCPDeleteAttachmentRequest, MCPDeleteAttachmentResponse>(
        "delete_cached_attachment",
        [this](const MCPDeleteAttachmentRequest& req) { return handleDeleteAttachment(req); },
        objectSchema({{"attachment_id", attachmentIdSchema()}}, {"attachment_id"}),
        "Remove a cached attachment and its extracted files.");

    spdlog::debug("Registered {} attachment tools", toolRegistry_->size());
}

boost::asio::awaitable<Result<MCPStoreAttachmentResponse>>
MCPServer::handleStoreAttachment(const MCPStoreAttachmentRequest& req) {
    auto id = cache::normalizeAttachmentId(req.attachmentId);
    if (!id) {
        co_return id.error();
    }
    auto outcome = cache_.lifecycle().store(id.value(), fetch_);
    if (!outcome) {
        co_return outcome.error();
    }
    const auto& entry = outcome.value().entry;
    MCPStoreAttachmentResponse resp;
    resp.attachmentId = entry.id;
    resp.filename = entry.filename;
    resp.size = entry.size;
    resp.contentType = entry.contentType;
    resp.fromCache = outcome.value().fromCache;
    co_return resp;
}

boost::asio::awaitable<Result<MCPStoreAndExtractResponse>>
MCPServer::handleStoreAndExtract(const MCPStoreAndExtractRequest& req) {
    auto id = cache::normalizeAttachmentId(req.attachmentId);
    if (!id) {
        co_return id.error();
    }
    cache::CancelFn cancel;
    if (auto token = tlsCancelToken_) {
        cancel = [token] { return token->load(); };
    }
    auto outcome = cache_.lifecycle().storeAndExtract(id.value(), fetch_, cancel);
    if (!outcome) {
        co_return outcome.error();
    }
    const auto& o = outcome.value();
    MCPStoreAndExtractResponse resp;
    resp.attachmentId = o.entry.id;
    resp.filename = o.entry.filename;
    resp.extracted = o.extracted;
    resp.fromCache = o.fromCache;
    resp.downloadFromCache = o.downloadFromCache;
    resp.extractionFromCache = o.extractionFromCache;
    resp.message = o.message;
    if (o.extraction) {
        const auto& tree = o.extraction->tree;
        resp.fileCount = tree.fileCount();
        for (const auto& f : tree.files) {
            if (f.isDirectory)
                continue;
            if (resp.files.size() >= MCPStoreAndExtractResponse::kMaxFilesListed)
                break;
            resp.files.push_back({f.path, f.size.value_or(0)});
        }
    }
    co_return resp;
}

boost::asio::awaitable<Result<MCPListFilesResponse>>
MCPServer::handleListFiles(const MCPListFilesRequest& req) {
    auto id = cache::normalizeAttachmentId(req.attachmentId);
    if (!id) {
        co_return id.error();
    }
    auto files = cache_.lister().list(id.value(), req.pattern);
    if (!files) {
        co_return files.error();
    }
    MCPListFilesResponse resp;
    resp.attachmentId = id.value();
    resp.files.reserve(files.value().size());
    for (const auto& f : files.value()) {
        resp.files.push_back({f.path, f.isDirectory ? "directory" : "file", f.size});
    }
    co_return resp;
}

boost::asio::awaitable<Result<MCPReadFileResponse>>
MCPServer::handleReadFile(const MCPReadFileRequest& req) {
    auto id = cache::normalizeAttachmentId(req.attachmentId);
    if (!id) {
        co_return id.error();
    }
    auto read = cache_.reader().read(id.value(), req.path, req.offset, req.limit);
    if (!read) {
        co_return read.error();
    }
    const auto& r = read.value();
    MCPReadFileResponse resp;
    resp.attachmentId = id.value();
    resp.path = r.path;
    resp.isBinary = r.isBinary();
    if (r.isBinary()) {
        resp.contentBase64 = r.binary().contentBase64;
        resp.size = r.binary().size;
        resp.contentType = r.binary().contentType;
    } else {
        resp.content = r.text().content;
        resp.linesReturned = r.text().linesReturned;
        resp.totalLines = r.text().totalLines;
        resp.hasMore = r.text().hasMore;
    }
    co_return resp;
}

boost::asio::awaitable<Result<MCPSearchFilesResponse>>
MCPServer::handleSearchFiles(const MCPSearchFilesRequest& req) {
    auto id = cache::normalizeAttachmentId(req.attachmentId);
    if (!id) {
        co_return id.error();
    }
    cache::SearchRequest sreq;
    sreq.pattern = req.pattern;
    sreq.glob = req.glob;
    sreq.contextLines = req.contextLines;
    sreq.maxResults = req.maxResults;
    auto found = cache_.search().search(id.value(), sreq);
    if (!found) {
        co_return found.error();
    }
    auto& s = found.value();
    MCPSearchFilesResponse resp;
    resp.attachmentId = id.value();
    resp.totalMatches = s.totalMatches;
    resp.filesSearched = s.filesSearched;
    resp.truncated = s.truncated;
    resp.matches.reserve(s.matches.size());
    for (const auto& m : s.matches) {
        resp.matches.push_back({m.path, m.line, m.content, m.contextBefore, m.contextAfter});
    }
    co_return resp;
}

boost::asio::awaitable<Result<MCPDeleteAttachmentResponse>>
MCPServer::handleDeleteAttachment(const MCPDeleteAttachmentRequest& req) {
    auto id = cache::normalizeAttachmentId(req.attachmentId);
    if (!id) {
        co_return id.error();
    }
    auto removed = cache_.lifecycle().remove(id.value());
    if (!removed) {
        co_return removed.error();
    }
    MCPDeleteAttachmentResponse resp;
    resp.attachmentId = id.value();
    resp.deleted = removed.value();
    co_return resp;
}

} // namespace attachd::mcp
