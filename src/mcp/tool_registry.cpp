#include <attachd/mcp/tool_registry.h>

#include <cmath>
#include <cstdint>
#include <limits>

namespace attachd::mcp {

namespace {
// Tolerant numeric parsing: accept number, numeric-like string; ignore empty string
static int64_t parse_int_tolerant(const json& j, const char* key, int64_t def) {
    if (!j.contains(key) || j[key].is_null())
        return def;
    if (j[key].is_number_unsigned()) {
        const auto u = j[key].get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            throw ToolArgumentError(std::string(key) + " is out of range");
        return static_cast<int64_t>(u);
    }
    if (j[key].is_number_integer())
        return j[key].get<int64_t>();
    if (j[key].is_number_float()) {
        // [-2^63, 2^63) is exactly representable as double bounds
        const double d = j[key].get<double>();
        if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0)
            throw ToolArgumentError(std::string(key) + " is out of range");
        if (d != std::trunc(d))
            throw ToolArgumentError(std::string(key) + " must be an integer");
        return static_cast<int64_t>(d);
    }
    if (j[key].is_string()) {
        auto s = j[key].get<std::string>();
        if (s.empty())
            return def;
        size_t pos = 0;
        int64_t v = 0;
        try {
            v = std::stoll(s, &pos);
        } catch (const std::exception&) {
            throw ToolArgumentError(std::string(key) + " must be an integer");
        }
        if (pos != s.size())
            throw ToolArgumentError(std::string(key) + " must be an integer");
        return v;
    }
    throw ToolArgumentError(std::string(key) + " must be an integer");
}

static size_t parse_size_tolerant(const json& j, const char* key, size_t def) {
    const auto v = parse_int_tolerant(j, key, static_cast<int64_t>(def));
    if (v < 0) {
        throw ToolArgumentError(std::string(key) + " must not be negative");
    }
    return static_cast<size_t>(v);
}

static std::string parse_string(const json& j, const char* key, const std::string& def) {
    if (!j.contains(key) || j[key].is_null())
        return def;
    if (!j[key].is_string()) {
        throw ToolArgumentError(std::string(key) + " must be a string");
    }
    return j[key].get<std::string>();
}

static std::string require_string(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        throw ToolArgumentError(std::string("missing required argument '") + key + "'");
    }
    return parse_string(j, key, {});
}

// Accepts 12345 or "12345"; validation of the characters happens in the cache layer.
static std::string parse_attachment_id(const json& j) {
    if (!j.is_object() || !j.contains("attachment_id") || j["attachment_id"].is_null()) {
        throw ToolArgumentError("missing required argument 'attachment_id'");
    }
    const auto& v = j["attachment_id"];
    if (v.is_number_unsigned())
        return std::to_string(v.get<uint64_t>());
    if (v.is_number_integer())
        return std::to_string(v.get<int64_t>());
    if (v.is_string())
        return v.get<std::string>();
    throw ToolArgumentError("attachment_id must be an integer or string");
}
} // namespace

// store_attachment

MCPStoreAttachmentRequest MCPStoreAttachmentRequest::fromJson(const json& j) {
    MCPStoreAttachmentRequest req;
    req.attachmentId = parse_attachment_id(j);
    return req;
}

json MCPStoreAttachmentRequest::toJson() const {
    return json{{"attachment_id", attachmentId}};
}

MCPStoreAttachmentResponse MCPStoreAttachmentResponse::fromJson(const json& j) {
    MCPStoreAttachmentResponse resp;
    resp.attachmentId = j.value("attachment_id", "");
    resp.filename = j.value("filename", "");
    resp.size = j.value("size", uint64_t{0});
    resp.contentType = j.value("content_type", "");
    resp.fromCache = j.value("from_cache", false);
    return resp;
}

json MCPStoreAttachmentResponse::toJson() const {
    return json{{"attachment_id", attachmentId},
                {"filename", filename},
                {"size", size},
                {"content_type", contentType},
                {"from_cache", fromCache}};
}

// store_and_extract_attachment

MCPStoreAndExtractRequest MCPStoreAndExtractRequest::fromJson(const json& j) {
    MCPStoreAndExtractRequest req;
    req.attachmentId = parse_attachment_id(j);
    return req;
}

json MCPStoreAndExtractRequest::toJson() const {
    return json{{"attachment_id", attachmentId}};
}

MCPStoreAndExtractResponse MCPStoreAndExtractResponse::fromJson(const json& j) {
    MCPStoreAndExtractResponse resp;
    resp.attachmentId = j.value("attachment_id", "");
    resp.filename = j.value("filename", "");
    resp.extracted = j.value("extracted", false);
    resp.fileCount = j.value("file_count", size_t{0});
    if (j.contains("files") && j["files"].is_array()) {
        for (const auto& f : j["files"]) {
            resp.files.push_back({f.value("path", ""), f.value("size", uint64_t{0})});
        }
    }
    resp.fromCache = j.value("from_cache", false);
    resp.downloadFromCache = j.value("download_from_cache", false);
    resp.extractionFromCache = j.value("extraction_from_cache", false);
    resp.message = j.value("message", "");
    return resp;
}

json MCPStoreAndExtractResponse::toJson() const {
    json files_json = json::array();
    for (const auto& f : files) {
        files_json.push_back({{"path", f.path}, {"size", f.size}});
    }
    json out{{"attachment_id", attachmentId},
             {"filename", filename},
             {"extracted", extracted},
             {"file_count", fileCount},
             {"files", std::move(files_json)},
             {"from_cache", fromCache},
             {"download_from_cache", downloadFromCache},
             {"extraction_from_cache", extractionFromCache}};
    if (!message.empty()) {
        out["message"] = message;
    }
    return out;
}

// list_attachment_files

MCPListFilesRequest MCPListFilesRequest::fromJson(const json& j) {
    MCPListFilesRequest req;
    req.attachmentId = parse_attachment_id(j);
    req.pattern = parse_string(j, "pattern", req.pattern);
    if (req.pattern.empty()) {
        req.pattern = "**/*";
    }
    return req;
}

json MCPListFilesRequest::toJson() const {
    return json{{"attachment_id", attachmentId}, {"pattern", pattern}};
}

MCPListFilesResponse MCPListFilesResponse::fromJson(const json& j) {
    MCPListFilesResponse resp;
    resp.attachmentId = j.value("attachment_id", "");
    if (j.contains("files") && j["files"].is_array()) {
        for (const auto& f : j["files"]) {
            File file;
            file.path = f.value("path", "");
            file.type = f.value("type", "file");
            if (f.contains("size") && f["size"].is_number()) {
                file.size = f["size"].get<uint64_t>();
            }
            resp.files.push_back(std::move(file));
        }
    }
    return resp;
}

json MCPListFilesResponse::toJson() const {
    json files_json = json::array();
    for (const auto& f : files) {
        json item{{"path", f.path}, {"type", f.type}};
        if (f.size) {
            item["size"] = *f.size;
        }
        files_json.push_back(std::move(item));
    }
    return json{
        {"attachment_id", attachmentId}, {"files", std::move(files_json)}, {"total", files.size()}};
}

// read_attachment_file

MCPReadFileRequest MCPReadFileRequest::fromJson(const json& j) {
    MCPReadFileRequest req;
    req.attachmentId = parse_attachment_id(j);
    req.path = require_string(j, "path");
    req.offset = parse_int_tolerant(j, "offset", req.offset);
    req.limit = parse_int_tolerant(j, "limit", req.limit);
    return req;
}

json MCPReadFileRequest::toJson() const {
    return json{
        {"attachment_id", attachmentId}, {"path", path}, {"offset", offset}, {"limit", limit}};
}

MCPReadFileResponse MCPReadFileResponse::fromJson(const json& j) {
    MCPReadFileResponse resp;
    resp.attachmentId = j.value("attachment_id", "");
    resp.path = j.value("path", "");
    resp.isBinary = j.value("is_binary", false);
    resp.content = j.value("content", "");
    resp.linesReturned = j.value("lines_returned", size_t{0});
    resp.totalLines = j.value("total_lines", size_t{0});
    resp.hasMore = j.value("has_more", false);
    resp.contentBase64 = j.value("content_base64", "");
    resp.size = j.value("size", uint64_t{0});
    resp.contentType = j.value("content_type", "");
    return resp;
}

json MCPReadFileResponse::toJson() const {
    json out{{"attachment_id", attachmentId}, {"path", path}, {"is_binary", isBinary}};
    if (isBinary) {
        out["content_base64"] = contentBase64;
        out["size"] = size;
        out["content_type"] = contentType;
    } else {
        out["content"] = content;
        out["lines_returned"] = linesReturned;
        out["total_lines"] = totalLines;
        out["has_more"] = hasMore;
    }
    return out;
}

// search_attachment_files

MCPSearchFilesRequest MCPSearchFilesRequest::fromJson(const json& j) {
    MCPSearchFilesRequest req;
    req.attachmentId = parse_attachment_id(j);
    req.pattern = require_string(j, "pattern");
    req.glob = parse_string(j, "glob", req.glob);
    req.contextLines = parse_size_tolerant(j, "context_lines", req.contextLines);
    req.maxResults = parse_size_tolerant(j, "max_results", req.maxResults);
    return req;
}

json MCPSearchFilesRequest::toJson() const {
    return json{{"attachment_id", attachmentId},
                {"pattern", pattern},
                {"glob", glob},
                {"context_lines", contextLines},
                {"max_results", maxResults}};
}

MCPSearchFilesResponse MCPSearchFilesResponse::fromJson(const json& j) {
    MCPSearchFilesResponse resp;
    resp.attachmentId = j.value("attachment_id", "");
    if (j.contains("matches") && j["matches"].is_array()) {
        for (const auto& m : j["matches"]) {
            Match match;
            match.path = m.value("path", "");
            match.line = m.value("line", size_t{0});
            match.content = m.value("content", "");
            match.contextBefore = m.value("context_before", std::vector<std::string>{});
            match.contextAfter = m.value("context_after", std::vector<std::string>{});
            resp.matches.push_back(std::move(match));
        }
    }
    resp.totalMatches = j.value("total_matches", size_t{0});
    resp.filesSearched = j.value("files_searched", size_t{0});
    resp.truncated = j.value("truncated", false);
    return resp;
}

json MCPSearchFilesResponse::toJson() const {
    json matches_json = json::array();
    for (const auto& m : matches) {
        matches_json.push_back({{"path", m.path},
                                {"line", m.line},
                                {"content", m.content},
                                {"context_before", m.contextBefore},
                                {"context_after", m.contextAfter}});
    }
    return json{{"attachment_id", attachmentId},
                {"matches", std::move(matches_json)},
                {"total_matches", totalMatches},
                {"files_searched", filesSearched},
                {"truncated", truncated}};
}

// delete_cached_attachment

MCPDeleteAttachmentRequest MCPDeleteAttachmentRequest::fromJson(const json& j) {
    MCPDeleteAttachmentRequest req;
    req.attachmentId = parse_attachment_id(j);
    return req;
}

json MCPDeleteAttachmentRequest::toJson() const {
    return json{{"attachment_id", attachmentId}};
}

MCPDeleteAttachmentResponse MCPDeleteAttachmentResponse::fromJson(const json& j) {
    MCPDeleteAttachmentResponse resp;
    resp.attachmentId = j.value("attachment_id", "");
    resp.deleted = j.value("deleted", false);
    return resp;
}

json MCPDeleteAttachmentResponse::toJson() const {
    return json{{"attachment_id", attachmentId}, {"deleted", deleted}};
}

} // namespace attachd::mcp
