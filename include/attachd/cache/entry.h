#pragma once

#include <nlohmann/json.hpp>
#include <attachd/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace attachd::cache {

// Caller-supplied artifact identifier, normalized to a path-safe string.
using AttachmentId = std::string;

inline constexpr size_t kMaxAttachmentIdLength = 128;

/**
 * @brief Validate an identifier for use as a directory name under the cache root.
 *
 * Accepts [A-Za-z0-9._-], 1..128 characters, not starting with '.'.
 */
[[nodiscard]] Result<AttachmentId> normalizeAttachmentId(std::string_view raw);

// Accepts a JSON integer or string identifier.
[[nodiscard]] Result<AttachmentId> attachmentIdFromJson(const nlohmann::json& value);

/**
 * @brief Committed metadata for one cached artifact. Immutable once written.
 */
struct Entry {
    AttachmentId id;
    std::string filename;
    std::uint64_t size = 0;
    std::string contentType;
    std::string sourceLocator;
    TimePoint storedAt{};

    nlohmann::json toJson() const;
    static Result<Entry> fromJson(const nlohmann::json& j);
};

/**
 * @brief One node of an entry's listable tree. Directories carry no size.
 */
struct FileInfo {
    std::string path; // relative, '/' separated
    std::optional<std::uint64_t> size;
    bool isDirectory = false;

    nlohmann::json toJson() const;
};

/**
 * @brief Extracted archive contents, ordered lexicographically by path.
 */
struct ExtractedTree {
    std::vector<FileInfo> files;

    size_t fileCount() const {
        size_t n = 0;
        for (const auto& f : files) {
            if (!f.isDirectory)
                ++n;
        }
        return n;
    }
};

// Per-entry disk usage, consumed by eviction policies.
struct EntryUsage {
    AttachmentId id;
    TimePoint storedAt{};
    std::uint64_t bytes = 0;
};

} // namespace attachd::cache
