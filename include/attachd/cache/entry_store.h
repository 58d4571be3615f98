#pragma once

#include <attachd/cache/cache_root.h>
#include <attachd/cache/entry.h>
#include <attachd/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace attachd::cache {

/**
 * @brief Per-entry layout under the cache root:
 *
 *   <root>/<id>/metadata.json        committed last; its presence means "entry exists"
 *   <root>/<id>/original/<filename>  the fetched bytes
 *   <root>/<id>/extracted/...        published atomically once extraction succeeds
 *
 * Entry writes and removals must be serialized per id by the caller
 * (see EntryLifecycleManager). Reads need no locking.
 */
class EntryStore {
public:
    static constexpr std::string_view kMetadataFile = "metadata.json";
    static constexpr std::string_view kOriginalDir = "original";
    static constexpr std::string_view kExtractedDir = "extracted";

    explicit EntryStore(CacheRoot root);

    const CacheRoot& root() const noexcept { return root_; }

    bool exists(const AttachmentId& id) const;
    bool isExtracted(const AttachmentId& id) const;

    /**
     * @brief Persist the original bytes and commit metadata.
     *
     * The filename hint is reduced to its final component; an empty result falls back
     * to "attachment-<id>". Partial writes never leave a visible entry behind.
     */
    Result<Entry> write(const AttachmentId& id, std::string_view bytes, std::string_view filenameHint,
                        std::string_view contentType = {}, std::string_view sourceLocator = {});

    Result<Entry> readMetadata(const AttachmentId& id) const;

    /**
     * @brief Remove an entry and all of its artifacts.
     *
     * The entry directory is renamed into the trash first so the removal is observed
     * atomically. @return false when no committed entry existed.
     */
    Result<bool> remove(const AttachmentId& id);

    // Best-effort removal of trash left behind by interrupted deletes.
    size_t sweepTrash();

    // Listable tree root: extracted/ when present, otherwise original/.
    Result<std::filesystem::path> listingRoot(const AttachmentId& id) const;

    // Committed entries with their disk usage. Unreadable entries are skipped.
    Result<std::vector<EntryUsage>> listEntries() const;

    std::filesystem::path entryDir(const AttachmentId& id) const { return root_.path() / id; }
    std::filesystem::path metadataPath(const AttachmentId& id) const {
        return entryDir(id) / kMetadataFile;
    }
    std::filesystem::path originalDir(const AttachmentId& id) const {
        return entryDir(id) / kOriginalDir;
    }
    std::filesystem::path originalPath(const Entry& entry) const {
        return originalDir(entry.id) / entry.filename;
    }
    std::filesystem::path extractedDir(const AttachmentId& id) const {
        return entryDir(id) / kExtractedDir;
    }

    static std::string sanitizeFilename(std::string_view hint, const AttachmentId& id);

private:
    Result<void> clearUncommitted(const AttachmentId& id);

    CacheRoot root_;
};

} // namespace attachd::cache
