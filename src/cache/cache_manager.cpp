#include "holdfast/cache/cache_manager.hpp"

#include "holdfast/cache/cache_entry.hpp"
#include "holdfast/events/events.hpp"

#include <exception>
#include <string>

namespace holdfast::cache {

CacheManager::CacheManager(store::DurableStore& store,
                           const Clock& clock,
                           events::EventBus& bus,
                           const Config& config)
    : store_(store),
      clock_(clock),
      bus_(bus),
      keys_(config.key_prefix),
      default_max_age_(config.cache.default_max_age),
      schema_version_(config.cache.schema_version) {}

Result<void, Error> CacheManager::set_json(const std::string& key,
                                           nlohmann::json data,
                                           std::optional<std::chrono::milliseconds> max_age) {
    auto guard = locks_.acquire(key);
    return write_locked(key, std::move(data), max_age);
}

std::optional<nlohmann::json> CacheManager::get_json(const std::string& key) {
    auto guard = locks_.acquire(key);
    return read_locked(key);
}

bool CacheManager::update_json(const std::string& key, const JsonTransform& transform) {
    auto guard = locks_.acquire(key);

    std::optional<nlohmann::json> next;
    try {
        next = transform(read_locked(key));
    } catch (const std::exception& e) {
        report_fault("update", key, Error::invalid(std::string("transform threw: ") + e.what()));
        return false;
    }
    if (!next) {
        return false;
    }
    return write_locked(key, std::move(*next), std::nullopt).is_ok();
}

Result<void, Error> CacheManager::remove(const std::string& key) {
    auto guard = locks_.acquire(key);

    auto removed = store_.remove(keys_.cache(key));
    if (removed.is_error()) {
        report_fault("remove", key, removed.error());
    }
    return removed;
}

Result<void, Error> CacheManager::clear_all() {
    const auto prefix = keys_.cache_prefix();

    auto listed = store::KeySpace::keys_under(store_, prefix);
    if (listed.is_error()) {
        report_fault("clear_all", prefix, listed.error());
        return Err<void>(listed.error());
    }
    if (listed.value().empty()) {
        return Ok();
    }

    auto removed = store_.remove_many(listed.value());
    if (removed.is_error()) {
        report_fault("clear_all", prefix, removed.error());
        return removed;
    }

    spdlog::info("Cleared {} cache entries", listed.value().size());
    return Ok();
}

CacheStats CacheManager::stats() {
    const auto prefix = keys_.cache_prefix();
    CacheStats stats;

    auto listed = store::KeySpace::keys_under(store_, prefix);
    if (listed.is_error()) {
        report_fault("stats", prefix, listed.error());
        return CacheStats{};
    }

    const auto now = clock_.now();
    for (const auto& storage_key : listed.value()) {
        auto raw = store_.get(storage_key);
        if (raw.is_error()) {
            report_fault("stats", storage_key.substr(prefix.size()), raw.error());
            return CacheStats{};
        }
        if (!raw.value()) {
            continue;  // Removed since the listing
        }

        ++stats.total_items;
        stats.approximate_size_bytes += storage_key.size() + raw.value()->size();

        auto decoded = decode_cache_entry(*raw.value());
        if (decoded.is_error() || decoded.value().expired(now)
            || decoded.value().schema_version != schema_version_) {
            ++stats.expired_items;
        } else {
            ++stats.valid_items;
        }
    }
    return stats;
}

std::optional<nlohmann::json> CacheManager::read_locked(const std::string& key) {
    const auto storage_key = keys_.cache(key);

    auto raw = store_.get(storage_key);
    if (raw.is_error()) {
        report_fault("get", key, raw.error());
        return std::nullopt;
    }
    if (!raw.value()) {
        return std::nullopt;
    }

    auto decoded = decode_cache_entry(*raw.value());
    if (decoded.is_error()) {
        spdlog::warn("Discarding unreadable cache entry {}: {}", key, decoded.error().message);
        if (auto removed = store_.remove(storage_key); removed.is_error()) {
            report_fault("get", key, removed.error());
        }
        return std::nullopt;
    }

    auto& entry = decoded.value();
    const auto now = clock_.now();
    const bool stale_schema = entry.schema_version != schema_version_;

    if (entry.expired(now) || stale_schema) {
        if (stale_schema) {
            spdlog::debug("Cache entry {} has schema {} (current {})", key, entry.schema_version, schema_version_);
        }
        if (auto removed = store_.remove(storage_key); removed.is_error()) {
            report_fault("get", key, removed.error());
        }
        bus_.emit(events::CacheEntryExpiredEvent{key, entry.age(now)});
        return std::nullopt;
    }

    return std::move(entry.data);
}

Result<void, Error> CacheManager::write_locked(const std::string& key,
                                               nlohmann::json data,
                                               std::optional<std::chrono::milliseconds> max_age) {
    CacheEntry entry;
    entry.data = std::move(data);
    entry.stored_at = clock_.now();
    entry.max_age = max_age.value_or(default_max_age_);
    entry.schema_version = schema_version_;

    if (entry.max_age.count() < 0) {
        return Err<void>(Error::invalid("cache max age must not be negative"));
    }

    auto encoded = encode(entry);
    if (encoded.is_error()) {
        spdlog::warn("Cache entry {} not stored: {}", key, encoded.error().message);
        return Err<void>(encoded.error());
    }

    auto stored = store_.set(keys_.cache(key), encoded.value());
    if (stored.is_error()) {
        report_fault("set", key, stored.error());
    }
    return stored;
}

void CacheManager::report_fault(const char* operation, const std::string& key, const Error& error) {
    spdlog::error("CacheManager::{} failed for {}: {}", operation, key, describe(error));
    bus_.emit(events::StorageFaultEvent{"cache", operation, error});
}

} // namespace holdfast::cache
