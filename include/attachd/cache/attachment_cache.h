#pragma once

#include <attachd/cache/archive_extractor.h>
#include <attachd/cache/content_search.h>
#include <attachd/cache/entry_lifecycle.h>
#include <attachd/cache/entry_store.h>
#include <attachd/cache/eviction_policy.h>
#include <attachd/cache/file_lister.h>
#include <attachd/cache/paginated_reader.h>
#include <attachd/core/types.h>

#include <filesystem>
#include <memory>

namespace attachd::cache {

struct CacheOptions {
    std::filesystem::path root; // empty -> CacheRoot::resolve() default
    ExtractOptions extract;
    ReadOptions read;
    std::shared_ptr<IEvictionPolicy> eviction;
};

/**
 * @brief Owns the cache components wired against one root.
 */
class AttachmentCache {
public:
    // Fails with StorageError when the root cannot be created or written.
    static Result<std::unique_ptr<AttachmentCache>> open(CacheOptions options);

    AttachmentCache(const AttachmentCache&) = delete;
    AttachmentCache& operator=(const AttachmentCache&) = delete;

    EntryStore& store() { return store_; }
    const EntryStore& store() const { return store_; }
    ArchiveExtractor& extractor() { return extractor_; }
    const FileLister& lister() const { return lister_; }
    const PaginatedReader& reader() const { return reader_; }
    const ContentSearchEngine& search() const { return search_; }
    EntryLifecycleManager& lifecycle() { return lifecycle_; }

    const std::filesystem::path& rootPath() const { return store_.root().path(); }

private:
    explicit AttachmentCache(CacheOptions options);

    EntryStore store_;
    ArchiveExtractor extractor_;
    FileLister lister_;
    PaginatedReader reader_;
    ContentSearchEngine search_;
    EntryLifecycleManager lifecycle_;
};

} // namespace attachd::cache
