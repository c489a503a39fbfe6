#pragma once

#include "holdfast/core/clock.hpp"
#include "holdfast/core/result.hpp"

#include <string>

namespace holdfast {

/**
 * @brief Open rate-limit window for one key
 *
 * Stored as {"count":n,"firstAttemptAt":ms,"lastAttemptAt":ms}. A stored
 * record always has count >= 1.
 */
struct AttemptRecord {
    int count = 0;
    TimePoint first_attempt_at{};
    TimePoint last_attempt_at{};

    std::chrono::milliseconds age(TimePoint now) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - first_attempt_at);
    }
};

std::string encode(const AttemptRecord& record);

/**
 * @brief Parse a stored record; CorruptRecord on bad JSON, missing fields,
 *        count < 1 or lastAttemptAt before firstAttemptAt
 */
Result<AttemptRecord, Error> decode_attempt_record(const std::string& text);

} // namespace holdfast
