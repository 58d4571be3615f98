#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace attachd::cache {

/**
 * @brief Table of per-key mutexes created on demand and dropped once no holder or
 * waiter references them, so memory tracks only the keys in flight.
 */
class KeyedMutex {
    struct Slot {
        std::mutex mutex;
        std::size_t refs = 0;
    };

public:
    class Guard {
    public:
        Guard(Guard&& other) noexcept
            : owner_(other.owner_), key_(std::move(other.key_)), slot_(other.slot_) {
            other.owner_ = nullptr;
            other.slot_ = nullptr;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

        ~Guard() {
            if (owner_) {
                owner_->release(key_, slot_);
            }
        }

    private:
        friend class KeyedMutex;
        Guard(KeyedMutex* owner, std::string key, Slot* slot)
            : owner_(owner), key_(std::move(key)), slot_(slot) {}

        KeyedMutex* owner_;
        std::string key_;
        Slot* slot_;
    };

    [[nodiscard]] Guard lock(const std::string& key) {
        Slot* slot = nullptr;
        {
            std::lock_guard<std::mutex> lk(tableMutex_);
            auto& entry = slots_[key];
            if (!entry) {
                entry = std::make_unique<Slot>();
            }
            ++entry->refs;
            slot = entry.get();
        }
        slot->mutex.lock();
        return Guard(this, key, slot);
    }

    // Number of keys currently held or awaited.
    std::size_t size() const {
        std::lock_guard<std::mutex> lk(tableMutex_);
        return slots_.size();
    }

private:
    void release(const std::string& key, Slot* slot) {
        slot->mutex.unlock();
        std::lock_guard<std::mutex> lk(tableMutex_);
        if (--slot->refs == 0) {
            slots_.erase(key);
        }
    }

    mutable std::mutex tableMutex_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

} // namespace attachd::cache
