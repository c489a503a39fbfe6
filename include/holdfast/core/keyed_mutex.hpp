#pragma once

/**
 * @file keyed_mutex.hpp
 * @brief One mutex per string key, created on demand and released when idle
 *
 * WHY THIS FILE EXISTS:
 * The durable store has no compare-and-swap. record_attempt() and the cache
 * update() read a value, change it and write it back. Two callers doing that
 * for the same key at the same time lose one of the changes. Serializing
 * per key keeps unrelated keys (two different users logging in) concurrent.
 *
 * LIFETIME:
 * A slot lives while at least one Guard references it. The table entry is
 * erased when the last Guard for that key is destroyed, so the table does
 * not grow with every key ever seen.
 *
 * EXAMPLE:
 * KeyedMutex locks;
 * {
 *     auto guard = locks.acquire("login:a@x.com");
 *     // read-modify-write for this key only
 * }
 */

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace holdfast {

class KeyedMutex {
    struct Slot {
        std::mutex mutex;
        std::size_t users = 0;
    };

public:
    class Guard {
    public:
        Guard(KeyedMutex& owner, std::string key, Slot* slot)
            : owner_(&owner), key_(std::move(key)), slot_(slot) {}

        Guard(Guard&& other) noexcept
            : owner_(other.owner_), key_(std::move(other.key_)), slot_(other.slot_) {
            other.owner_ = nullptr;
            other.slot_ = nullptr;
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

        ~Guard() {
            if (owner_ != nullptr && slot_ != nullptr) {
                owner_->release(key_, slot_);
            }
        }

        const std::string& key() const noexcept { return key_; }

    private:
        KeyedMutex* owner_;
        std::string key_;
        Slot* slot_;
    };

    KeyedMutex() = default;
    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    /**
     * @brief Block until the calling thread owns @p key
     */
    Guard acquire(const std::string& key) {
        Slot* slot = nullptr;
        {
            std::lock_guard lock(table_mutex_);
            auto& entry = slots_[key];
            if (!entry) {
                entry = std::make_unique<Slot>();
            }
            ++entry->users;
            slot = entry.get();
        }
        slot->mutex.lock();
        return Guard(*this, key, slot);
    }

    /**
     * @brief Number of keys currently held or waited on
     */
    std::size_t active_keys() const {
        std::lock_guard lock(table_mutex_);
        return slots_.size();
    }

private:
    void release(const std::string& key, Slot* slot) {
        slot->mutex.unlock();
        std::lock_guard lock(table_mutex_);
        if (--slot->users == 0) {
            slots_.erase(key);
        }
    }

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

} // namespace holdfast
