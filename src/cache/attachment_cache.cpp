#include <attachd/cache/attachment_cache.h>

#include <spdlog/spdlog.h>

namespace attachd::cache {

AttachmentCache::AttachmentCache(CacheOptions options)
    : store_(CacheRoot(CacheRoot::resolve(options.root))),
      extractor_(store_, std::move(options.extract)),
      lister_(store_),
      reader_(store_, options.read),
      search_(store_),
      lifecycle_(store_, extractor_, std::move(options.eviction)) {}

Result<std::unique_ptr<AttachmentCache>> AttachmentCache::open(CacheOptions options) {
    std::unique_ptr<AttachmentCache> cache(new AttachmentCache(std::move(options)));
    if (auto r = cache->store_.root().ensure(); !r) {
        return r.error();
    }
    cache->store_.sweepTrash();
    spdlog::info("Attachment cache at {}", cache->rootPath().string());
    return std::move(cache);
}

} // namespace attachd::cache
