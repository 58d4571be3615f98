#include <attachd/cache/entry.h>

#include <cctype>
#include <ctime>

namespace attachd::cache {

namespace {

std::string formatIso8601(TimePoint tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace

Result<AttachmentId> normalizeAttachmentId(std::string_view raw) {
    if (raw.empty()) {
        return Error{ErrorCode::InvalidPath, "Attachment id must not be empty"};
    }
    if (raw.size() > kMaxAttachmentIdLength) {
        return Error{ErrorCode::InvalidPath, "Attachment id is too long"};
    }
    if (raw.front() == '.') {
        return Error{ErrorCode::InvalidPath,
                     "Attachment id must not start with '.': " + std::string(raw)};
    }
    for (unsigned char c : raw) {
        if (!std::isalnum(c) && c != '.' && c != '_' && c != '-') {
            return Error{ErrorCode::InvalidPath,
                         "Attachment id contains disallowed characters: " + std::string(raw)};
        }
    }
    return AttachmentId(raw);
}

Result<AttachmentId> attachmentIdFromJson(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return normalizeAttachmentId(std::to_string(value.get<std::uint64_t>()));
    }
    if (value.is_number_integer()) {
        return normalizeAttachmentId(std::to_string(value.get<std::int64_t>()));
    }
    if (value.is_string()) {
        return normalizeAttachmentId(value.get<std::string>());
    }
    return Error{ErrorCode::InvalidArgument, "attachment_id must be an integer or string"};
}

nlohmann::json Entry::toJson() const {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(storedAt.time_since_epoch()).count();
    return nlohmann::json{{"attachment_id", id},
                          {"filename", filename},
                          {"size", size},
                          {"content_type", contentType},
                          {"source_locator", sourceLocator},
                          {"stored_at", formatIso8601(storedAt)},
                          {"stored_at_ms", ms}};
}

Result<Entry> Entry::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "Metadata is not a JSON object"};
    }
    try {
        Entry e;
        auto id = attachmentIdFromJson(j.at("attachment_id"));
        if (!id) {
            return Error{ErrorCode::InvalidData, id.error().message};
        }
        e.id = id.value();
        e.filename = j.at("filename").get<std::string>();
        e.size = j.at("size").get<std::uint64_t>();
        e.contentType = j.value("content_type", std::string{});
        e.sourceLocator = j.value("source_locator", std::string{});
        e.storedAt = TimePoint{std::chrono::milliseconds(j.value<std::int64_t>("stored_at_ms", 0))};
        if (e.filename.empty()) {
            return Error{ErrorCode::InvalidData, "Metadata has an empty filename"};
        }
        return e;
    } catch (const nlohmann::json::exception& ex) {
        return Error{ErrorCode::InvalidData, std::string("Malformed metadata: ") + ex.what()};
    }
}

nlohmann::json FileInfo::toJson() const {
    nlohmann::json j{{"path", path}, {"type", isDirectory ? "directory" : "file"}};
    if (!isDirectory && size) {
        j["size"] = *size;
    }
    return j;
}

} // namespace attachd::cache
