#pragma once

#include "holdfast/core/clock.hpp"
#include "holdfast/core/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace holdfast::cache {

/**
 * @brief Stored envelope around a cached payload
 *
 * {"data":<payload>,"storedAt":ms,"maxAge":ms,"schemaVersion":"1.0"}
 */
struct CacheEntry {
    nlohmann::json data;
    TimePoint stored_at{};
    std::chrono::milliseconds max_age{0};
    std::string schema_version;

    std::chrono::milliseconds age(TimePoint now) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - stored_at);
    }

    bool expired(TimePoint now) const { return age(now) > max_age; }
};

Result<std::string, Error> encode(const CacheEntry& entry);

Result<CacheEntry, Error> decode_cache_entry(const std::string& text);

} // namespace holdfast::cache
