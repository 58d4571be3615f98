#pragma once

#include <attachd/cache/entry.h>
#include <attachd/core/types.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace attachd::cache {

/**
 * @brief Chooses entries to delete after a new entry is committed.
 *
 * Policies only select; the lifecycle manager performs deletion under the per-id lock
 * and never evicts the entry that was just stored.
 */
class IEvictionPolicy {
public:
    virtual ~IEvictionPolicy() = default;

    virtual std::vector<AttachmentId> selectVictims(const std::vector<EntryUsage>& entries,
                                                    TimePoint now) const = 0;
    virtual std::string name() const = 0;
};

// Oldest entries first until the total fits within the budget.
class MaxTotalBytesPolicy : public IEvictionPolicy {
public:
    explicit MaxTotalBytesPolicy(std::uint64_t maxBytes) : maxBytes_(maxBytes) {}

    std::vector<AttachmentId> selectVictims(const std::vector<EntryUsage>& entries,
                                            TimePoint now) const override;
    std::string name() const override { return "max_total_bytes"; }

private:
    std::uint64_t maxBytes_;
};

class MaxAgePolicy : public IEvictionPolicy {
public:
    explicit MaxAgePolicy(std::chrono::hours maxAge) : maxAge_(maxAge) {}

    std::vector<AttachmentId> selectVictims(const std::vector<EntryUsage>& entries,
                                            TimePoint now) const override;
    std::string name() const override { return "max_age"; }

private:
    std::chrono::hours maxAge_;
};

// Union of the victims chosen by each child policy.
class CompositeEvictionPolicy : public IEvictionPolicy {
public:
    void add(std::shared_ptr<IEvictionPolicy> policy) { policies_.push_back(std::move(policy)); }
    bool empty() const { return policies_.empty(); }

    std::vector<AttachmentId> selectVictims(const std::vector<EntryUsage>& entries,
                                            TimePoint now) const override;
    std::string name() const override;

private:
    std::vector<std::shared_ptr<IEvictionPolicy>> policies_;
};

// Builds the configured policy; nullptr when both limits are disabled (0).
std::shared_ptr<IEvictionPolicy> makeEvictionPolicy(std::uint64_t maxTotalBytes,
                                                    std::uint64_t maxAgeHours);

} // namespace attachd::cache
