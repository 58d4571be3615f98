#include <attachd/cache/entry_lifecycle.h>

#include <spdlog/spdlog.h>

namespace attachd::cache {

EntryLifecycleManager::EntryLifecycleManager(EntryStore& store, ArchiveExtractor& extractor,
                                             std::shared_ptr<IEvictionPolicy> eviction)
    : store_(store), extractor_(extractor), eviction_(std::move(eviction)) {}

Result<StoreOutcome> EntryLifecycleManager::storeLocked(const AttachmentId& id,
                                                        const upstream::FetchFn& fetch) {
    if (auto meta = store_.readMetadata(id)) {
        spdlog::debug("Attachment {} served from cache", id);
        return StoreOutcome{std::move(meta).value(), true};
    }
    if (!fetch) {
        return Error{ErrorCode::NotInitialized, "No upstream fetcher configured"};
    }

    spdlog::debug("Fetching attachment {} from upstream", id);
    auto fetched = fetch(id);
    if (!fetched) {
        spdlog::warn("Upstream fetch for attachment {} failed: {}", id, fetched.error().message);
        return fetched.error();
    }
    const auto& f = fetched.value();
    auto written = store_.write(id, f.bytes, f.filename, f.contentType, f.sourceLocator);
    if (!written) {
        return written.error();
    }
    return StoreOutcome{std::move(written).value(), false};
}

Result<StoreOutcome> EntryLifecycleManager::store(const AttachmentId& id,
                                                  const upstream::FetchFn& fetch) {
    if (auto valid = normalizeAttachmentId(id); !valid) {
        return valid.error();
    }
    if (auto r = store_.root().ensure(); !r) {
        return r.error();
    }

    Result<StoreOutcome> outcome = [&] {
        auto guard = locks_.lock(id);
        return storeLocked(id, fetch);
    }();
    if (outcome && !outcome.value().fromCache) {
        runEviction(id);
    }
    return outcome;
}

Result<StoreAndExtractOutcome>
EntryLifecycleManager::storeAndExtract(const AttachmentId& id, const upstream::FetchFn& fetch,
                                       const CancelFn& cancel) {
    if (auto valid = normalizeAttachmentId(id); !valid) {
        return valid.error();
    }
    if (auto r = store_.root().ensure(); !r) {
        return r.error();
    }

    StoreAndExtractOutcome out;
    {
        auto guard = locks_.lock(id);
        auto stored = storeLocked(id, fetch);
        if (!stored) {
            return stored.error();
        }
        auto s = std::move(stored).value();
        out.entry = std::move(s.entry);
        out.downloadFromCache = s.fromCache;

        if (!isArchive(out.entry.filename)) {
            out.message = "File '" + out.entry.filename +
                          "' is not a supported archive (zip, tar, tar.gz, tgz, tar.bz2, tbz2); "
                          "use read_attachment_file to access it directly";
            out.fromCache = out.downloadFromCache;
        } else {
            // A failed extraction leaves the stored original in place.
            auto extraction = extractor_.extract(id, cancel);
            if (!extraction) {
                return extraction.error();
            }
            out.extracted = true;
            out.extractionFromCache = extraction.value().fromCache;
            out.extraction = std::move(extraction).value();
            out.fromCache = out.downloadFromCache && out.extractionFromCache;
        }
    }
    if (!out.downloadFromCache) {
        runEviction(id);
    }
    return out;
}

Result<bool> EntryLifecycleManager::remove(const AttachmentId& id) {
    if (auto valid = normalizeAttachmentId(id); !valid) {
        return valid.error();
    }
    auto guard = locks_.lock(id);
    return store_.remove(id);
}

void EntryLifecycleManager::runEviction(const AttachmentId& justStored) {
    if (!eviction_) {
        return;
    }
    auto entries = store_.listEntries();
    if (!entries) {
        spdlog::warn("Eviction skipped: {}", entries.error().message);
        return;
    }
    const auto victims = eviction_->selectVictims(entries.value(), std::chrono::system_clock::now());
    for (const auto& victim : victims) {
        if (victim == justStored) {
            continue;
        }
        auto guard = locks_.lock(victim);
        auto removed = store_.remove(victim);
        if (!removed) {
            spdlog::warn("Eviction of attachment {} failed: {}", victim, removed.error().message);
        } else if (removed.value()) {
            spdlog::info("Evicted attachment {} ({})", victim, eviction_->name());
        }
    }
}

} // namespace attachd::cache
