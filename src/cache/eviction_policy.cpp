#include <attachd/cache/eviction_policy.h>

#include <algorithm>
#include <unordered_set>

namespace attachd::cache {

std::vector<AttachmentId> MaxTotalBytesPolicy::selectVictims(const std::vector<EntryUsage>& entries,
                                                             TimePoint) const {
    std::uint64_t total = 0;
    for (const auto& e : entries) {
        total += e.bytes;
    }
    if (total <= maxBytes_) {
        return {};
    }

    std::vector<const EntryUsage*> byAge;
    byAge.reserve(entries.size());
    for (const auto& e : entries) {
        byAge.push_back(&e);
    }
    std::sort(byAge.begin(), byAge.end(), [](const EntryUsage* a, const EntryUsage* b) {
        if (a->storedAt != b->storedAt)
            return a->storedAt < b->storedAt;
        return a->id < b->id;
    });

    std::vector<AttachmentId> victims;
    for (const auto* e : byAge) {
        if (total <= maxBytes_)
            break;
        victims.push_back(e->id);
        total -= std::min(total, e->bytes);
    }
    return victims;
}

std::vector<AttachmentId> MaxAgePolicy::selectVictims(const std::vector<EntryUsage>& entries,
                                                      TimePoint now) const {
    std::vector<AttachmentId> victims;
    const auto cutoff = now - maxAge_;
    for (const auto& e : entries) {
        if (e.storedAt < cutoff) {
            victims.push_back(e.id);
        }
    }
    return victims;
}

std::vector<AttachmentId>
CompositeEvictionPolicy::selectVictims(const std::vector<EntryUsage>& entries, TimePoint now) const {
    std::vector<AttachmentId> victims;
    std::unordered_set<AttachmentId> seen;
    for (const auto& p : policies_) {
        for (auto& id : p->selectVictims(entries, now)) {
            if (seen.insert(id).second) {
                victims.push_back(std::move(id));
            }
        }
    }
    return victims;
}

std::string CompositeEvictionPolicy::name() const {
    std::string out;
    for (const auto& p : policies_) {
        if (!out.empty())
            out += "+";
        out += p->name();
    }
    return out;
}

std::shared_ptr<IEvictionPolicy> makeEvictionPolicy(std::uint64_t maxTotalBytes,
                                                    std::uint64_t maxAgeHours) {
    auto composite = std::make_shared<CompositeEvictionPolicy>();
    if (maxTotalBytes > 0) {
        composite->add(std::make_shared<MaxTotalBytesPolicy>(maxTotalBytes));
    }
    if (maxAgeHours > 0) {
        composite->add(std::make_shared<MaxAgePolicy>(
            std::chrono::hours(static_cast<std::chrono::hours::rep>(maxAgeHours))));
    }
    if (composite->empty()) {
        return nullptr;
    }
    return composite;
}

} // namespace attachd::cache
