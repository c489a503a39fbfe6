#include "holdfast/cache/cache_entry.hpp"

namespace holdfast::cache {

Result<std::string, Error> encode(const CacheEntry& entry) {
    const nlohmann::json j{
        {"data", entry.data},
        {"storedAt", to_millis(entry.stored_at)},
        {"maxAge", entry.max_age.count()},
        {"schemaVersion", entry.schema_version},
    };
    try {
        return Ok<std::string, Error>(j.dump());
    } catch (const nlohmann::json::exception& e) {
        // Invalid UTF-8 inside the payload
        return Err<std::string>(Error::invalid(std::string("cache payload: ") + e.what()));
    }
}

Result<CacheEntry, Error> decode_cache_entry(const std::string& text) {
    const auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Err<CacheEntry>(Error::corrupt("cache entry is not a JSON object"));
    }

    CacheEntry entry;
    std::int64_t stored_millis = 0;
    try {
        entry.data = j.at("data");
        stored_millis = j.at("storedAt").get<std::int64_t>();
        entry.max_age = std::chrono::milliseconds(j.at("maxAge").get<std::int64_t>());
        entry.schema_version = j.value("schemaVersion", std::string{});
    } catch (const nlohmann::json::exception& e) {
        return Err<CacheEntry>(Error::corrupt(std::string("cache entry: ") + e.what()));
    }

    if (!persisted_millis_in_range(stored_millis)) {
        return Err<CacheEntry>(Error::corrupt("cache entry storedAt out of range"));
    }
    if (entry.max_age.count() < 0) {
        return Err<CacheEntry>(Error::corrupt("cache entry with negative maxAge"));
    }
    entry.stored_at = from_millis(stored_millis);
    return Ok<CacheEntry, Error>(std::move(entry));
}

} // namespace holdfast::cache
