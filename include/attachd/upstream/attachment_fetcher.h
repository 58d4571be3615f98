#pragma once

#include <attachd/cache/entry.h>
#include <attachd/core/types.h>

#include <functional>
#include <string>

namespace attachd::upstream {

struct FetchedAttachment {
    std::string bytes;
    std::string filename;
    std::string contentType;
    std::string sourceLocator; // where the bytes came from, recorded in metadata
};

// Retrieves the authoritative bytes for an identifier on cache miss.
class IAttachmentFetcher {
public:
    virtual ~IAttachmentFetcher() = default;

    /**
     * @return UpstreamFetchError carrying the upstream's message on any failure.
     */
    virtual Result<FetchedAttachment> fetch(const cache::AttachmentId& id) = 0;
};

using FetchFn = std::function<Result<FetchedAttachment>(const cache::AttachmentId&)>;

} // namespace attachd::upstream
