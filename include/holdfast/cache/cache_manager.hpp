#pragma once

/**
 * @file cache_manager.hpp
 * @brief TTL cache of remote-derived data for offline use
 *
 * Payloads are any type nlohmann::json can convert (to_json/from_json).
 * Reads never fail loudly: a missing, corrupt, expired or
 * schema-mismatched entry is simply absent. Expired and mismatched entries
 * are deleted by the read that finds them.
 *
 * EXAMPLE:
 * CacheManager cache(store, clock, bus);
 * cache.set("cards:list", cards, std::chrono::minutes(10));
 * if (auto cached = cache.get<std::vector<Card>>("cards:list")) {
 *     render(*cached);
 * }
 * cache.update<std::vector<Card>>("cards:list", [&](auto current) -> std::optional<std::vector<Card>> {
 *     if (!current) return std::nullopt;   // nothing to patch
 *     current->push_back(new_card);
 *     return current;
 * });
 */

#include "holdfast/core/clock.hpp"
#include "holdfast/core/config.hpp"
#include "holdfast/core/keyed_mutex.hpp"
#include "holdfast/core/result.hpp"
#include "holdfast/events/event_bus.hpp"
#include "holdfast/store/durable_store.hpp"
#include "holdfast/store/key_space.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace holdfast::cache {

struct CacheStats {
    std::size_t total_items = 0;
    std::size_t valid_items = 0;
    std::size_t expired_items = 0;  ///< Includes entries that do not decode
    std::size_t approximate_size_bytes = 0;
};

class CacheManager {
public:
    using JsonTransform = std::function<std::optional<nlohmann::json>(std::optional<nlohmann::json>)>;

    CacheManager(store::DurableStore& store,
                 const Clock& clock,
                 events::EventBus& bus,
                 const Config& config = Config{});

    /**
     * @brief Store @p data under @p key, stamped now
     *
     * @param max_age defaults to the configured cache max age
     */
    template<typename T>
    Result<void, Error> set(const std::string& key,
                            const T& data,
                            std::optional<std::chrono::milliseconds> max_age = std::nullopt) {
        return set_json(key, nlohmann::json(data), max_age);
    }

    template<typename T>
    std::optional<T> get(const std::string& key) {
        auto data = get_json(key);
        if (!data) {
            return std::nullopt;
        }
        return convert<T>(key, *data);
    }

    /**
     * @brief Read, transform and write back under the key's lock
     *
     * @p transform receives the current value (std::nullopt when absent or
     * unreadable as T) and returns the new value, or std::nullopt for
     * "no change".
     *
     * A transform that throws, or a result that does not convert to JSON,
     * leaves the entry unchanged and is reported as a StorageFaultEvent.
     *
     * @return true when a new value was written
     */
    template<typename T, typename Transform>
    bool update(const std::string& key, Transform&& transform) {
        return update_json(key, [&](std::optional<nlohmann::json> current) -> std::optional<nlohmann::json> {
            std::optional<T> typed;
            if (current) {
                typed = convert<T>(key, *current);
            }
            std::optional<T> next = transform(std::move(typed));
            if (!next) {
                return std::nullopt;
            }
            return nlohmann::json(*next);
        });
    }

    Result<void, Error> set_json(const std::string& key,
                                 nlohmann::json data,
                                 std::optional<std::chrono::milliseconds> max_age = std::nullopt);

    std::optional<nlohmann::json> get_json(const std::string& key);

    bool update_json(const std::string& key, const JsonTransform& transform);

    Result<void, Error> remove(const std::string& key);

    /// Delete every cache entry; rate-limit and queue keys are untouched
    Result<void, Error> clear_all();

    /// Scan of the cache namespace; zeroed when the scan fails
    CacheStats stats();

private:
    template<typename T>
    static std::optional<T> convert(const std::string& key, const nlohmann::json& data) {
        try {
            return data.get<T>();
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Cache entry {} does not match the requested type: {}", key, e.what());
            return std::nullopt;
        }
    }

    std::optional<nlohmann::json> read_locked(const std::string& key);
    Result<void, Error> write_locked(const std::string& key,
                                     nlohmann::json data,
                                     std::optional<std::chrono::milliseconds> max_age);

    void report_fault(const char* operation, const std::string& key, const Error& error);

    store::DurableStore& store_;
    const Clock& clock_;
    events::EventBus& bus_;
    store::KeySpace keys_;
    std::chrono::milliseconds default_max_age_;
    std::string schema_version_;
    KeyedMutex locks_;
};

} // namespace holdfast::cache
