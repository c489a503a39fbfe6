#include "holdfast/ratelimit/attempt_record.hpp"

#include <nlohmann/json.hpp>

namespace holdfast {

std::string encode(const AttemptRecord& record) {
    const nlohmann::json j{
        {"count", record.count},
        {"firstAttemptAt", to_millis(record.first_attempt_at)},
        {"lastAttemptAt", to_millis(record.last_attempt_at)},
    };
    return j.dump();
}

Result<AttemptRecord, Error> decode_attempt_record(const std::string& text) {
    const auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Err<AttemptRecord>(Error::corrupt("attempt record is not a JSON object"));
    }

    AttemptRecord record;
    std::int64_t first_millis = 0;
    std::int64_t last_millis = 0;
    try {
        record.count = j.at("count").get<int>();
        first_millis = j.at("firstAttemptAt").get<std::int64_t>();
        last_millis = j.at("lastAttemptAt").get<std::int64_t>();
    } catch (const nlohmann::json::exception& e) {
        return Err<AttemptRecord>(Error::corrupt(std::string("attempt record: ") + e.what()));
    }

    if (!persisted_millis_in_range(first_millis) || !persisted_millis_in_range(last_millis)) {
        return Err<AttemptRecord>(Error::corrupt("attempt record timestamp out of range"));
    }
    record.first_attempt_at = from_millis(first_millis);
    record.last_attempt_at = from_millis(last_millis);

    if (record.count < 1) {
        return Err<AttemptRecord>(Error::corrupt("attempt record with count " + std::to_string(record.count)));
    }
    if (record.last_attempt_at < record.first_attempt_at) {
        return Err<AttemptRecord>(Error::corrupt("attempt record ends before it starts"));
    }
    return Ok<AttemptRecord, Error>(record);
}

} // namespace holdfast
