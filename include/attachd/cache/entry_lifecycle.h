#pragma once

#include <attachd/cache/archive_extractor.h>
#include <attachd/cache/entry_store.h>
#include <attachd/cache/eviction_policy.h>
#include <attachd/cache/keyed_mutex.h>
#include <attachd/core/types.h>
#include <attachd/upstream/attachment_fetcher.h>

#include <memory>
#include <optional>
#include <string>

namespace attachd::cache {

struct StoreOutcome {
    Entry entry;
    bool fromCache = false;
};

struct StoreAndExtractOutcome {
    Entry entry;
    bool extracted = false;
    std::optional<ExtractionResult> extraction;
    bool downloadFromCache = false;
    bool extractionFromCache = false;
    bool fromCache = false; // both steps were cache hits
    std::string message;    // set when the entry is not an archive
};

/**
 * @brief Orchestrates fetch-if-absent, extraction and deletion for entries.
 *
 * Mutating steps for one id run under that id's lock, so concurrent first requests
 * fetch once and deletion never interleaves with publication. Different ids proceed
 * in parallel.
 */
class EntryLifecycleManager {
public:
    EntryLifecycleManager(EntryStore& store, ArchiveExtractor& extractor,
                          std::shared_ptr<IEvictionPolicy> eviction = nullptr);

    Result<StoreOutcome> store(const AttachmentId& id, const upstream::FetchFn& fetch);
    // `cancel` is polled during extraction; a tripped callback yields OperationCancelled
    // and leaves the stored original in place.
    Result<StoreAndExtractOutcome> storeAndExtract(const AttachmentId& id,
                                                   const upstream::FetchFn& fetch,
                                                   const CancelFn& cancel = {});
    Result<bool> remove(const AttachmentId& id);

    std::size_t activeLocks() const { return locks_.size(); }

private:
    Result<StoreOutcome> storeLocked(const AttachmentId& id, const upstream::FetchFn& fetch);
    void runEviction(const AttachmentId& justStored);

    EntryStore& store_;
    ArchiveExtractor& extractor_;
    std::shared_ptr<IEvictionPolicy> eviction_;
    KeyedMutex locks_;
};

} // namespace attachd::cache
