#pragma once

/**
 * @file memory_store.hpp
 * @brief Thread-safe in-memory DurableStore
 *
 * WHY THIS FILE EXISTS:
 * Tests and short-lived processes need a store that behaves like the real
 * one (same interface, same concurrency guarantees) without touching disk.
 * FileStore builds on the same map and adds persistence.
 *
 * THREAD SAFETY PATTERN:
 * - get / list_keys take a shared_lock (many concurrent readers)
 * - set / remove / remove_many take a unique_lock (one writer)
 *
 * EXAMPLE USAGE:
 * MemoryStore store;
 * store.set("holdfast:rate:login:a@x.com", R"({"count":1,...})");
 * auto value = store.get("holdfast:rate:login:a@x.com");
 * if (value.is_ok() && value.value()) {
 *     // *value.value() is the stored text
 * }
 */

#include "holdfast/store/durable_store.hpp"

#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace holdfast::store {

class MemoryStore : public DurableStore {
public:
    MemoryStore() = default;

    Result<std::optional<std::string>, Error> get(const std::string& key) override {
        std::shared_lock lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return Ok<std::optional<std::string>, Error>(std::nullopt);
        }
        return Ok<std::optional<std::string>, Error>(it->second);
    }

    Result<void, Error> set(const std::string& key, std::string value) override {
        std::unique_lock lock(mutex_);
        values_[key] = std::move(value);
        return Ok();
    }

    Result<void, Error> remove(const std::string& key) override {
        std::unique_lock lock(mutex_);
        values_.erase(key);
        return Ok();
    }

    Result<std::vector<std::string>, Error> list_keys() override {
        std::shared_lock lock(mutex_);

        std::vector<std::string> keys;
        keys.reserve(values_.size());
        for (const auto& [key, value] : values_) {
            keys.push_back(key);
        }
        return Ok<std::vector<std::string>, Error>(std::move(keys));
    }

    Result<void, Error> remove_many(const std::vector<std::string>& keys) override {
        std::unique_lock lock(mutex_);
        for (const auto& key : keys) {
            values_.erase(key);
        }
        return Ok();
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return values_.size();
    }

private:
    mutable std::shared_mutex mutex_;  // Reader-writer lock
    std::unordered_map<std::string, std::string> values_;
};

} // namespace holdfast::store
