#include "holdfast/ratelimit/attempt_tracker.hpp"

#include "holdfast/core/redact.hpp"
#include "holdfast/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace holdfast {
namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;

seconds seconds_until(TimePoint end, TimePoint now) {
    if (end <= now) {
        return seconds{0};
    }
    return std::chrono::ceil<seconds>(end - now);
}

} // namespace

AttemptTracker::AttemptTracker(store::DurableStore& store,
                               const Clock& clock,
                               events::EventBus& bus,
                               const Config& config)
    : store_(store),
      clock_(clock),
      bus_(bus),
      keys_(config.key_prefix),
      retention_(config.rate_limit.retention) {}

Outcome<bool> AttemptTracker::check_limit(const std::string& key, int max_attempts, milliseconds window) {
    auto guard = locks_.acquire(key);
    const auto storage_key = keys_.rate(key);

    auto loaded = load(storage_key);
    if (loaded.is_error()) {
        report_fault("check_limit", key, loaded.error());
        return degraded(false, loaded.error());
    }

    const auto& record = loaded.value();
    if (!record) {
        return clean(true);
    }

    const auto now = clock_.now();
    if (record->age(now) >= window) {
        // Window elapsed: start over
        if (auto removed = store_.remove(storage_key); removed.is_error()) {
            report_fault("check_limit", key, removed.error());
            return degraded(true, removed.error());
        }
        return clean(true);
    }

    if (record->count >= max_attempts) {
        const auto retry_after = seconds_until(record->first_attempt_at + window, now);
        bus_.emit(events::RateLimitExceededEvent{key, record->count, retry_after});
        return clean(false);
    }

    return clean(true);
}

Outcome<bool> AttemptTracker::check_limit(const std::string& key, const RateLimitPolicy& policy) {
    return check_limit(key, policy.max_attempts, policy.window);
}

Result<void, Error> AttemptTracker::record_attempt(const std::string& key) {
    auto guard = locks_.acquire(key);
    const auto storage_key = keys_.rate(key);
    const auto now = clock_.now();

    AttemptRecord record{0, now, now};

    auto loaded = load(storage_key);
    if (loaded.is_error()) {
        if (loaded.error().kind != ErrorKind::CorruptRecord) {
            report_fault("record_attempt", key, loaded.error());
            return Err<void>(loaded.error());
        }
        spdlog::warn("Replacing corrupt attempt record for {}: {}",
                     redact::identifier(key), loaded.error().message);
    } else if (loaded.value()) {
        record = *loaded.value();
    }

    record.count += 1;
    record.last_attempt_at = now;

    if (auto stored = store_.set(storage_key, encode(record)); stored.is_error()) {
        report_fault("record_attempt", key, stored.error());
        return stored;
    }

    bus_.emit(events::AttemptRecordedEvent{key, record.count});
    return Ok();
}

Result<void, Error> AttemptTracker::reset_attempts(const std::string& key) {
    auto guard = locks_.acquire(key);

    if (auto removed = store_.remove(keys_.rate(key)); removed.is_error()) {
        report_fault("reset_attempts", key, removed.error());
        return removed;
    }

    bus_.emit(events::AttemptsResetEvent{key});
    return Ok();
}

Outcome<int> AttemptTracker::remaining_attempts(const std::string& key, int max_attempts) {
    auto loaded = load(keys_.rate(key));
    if (loaded.is_error()) {
        report_fault("remaining_attempts", key, loaded.error());
        return degraded(0, loaded.error());
    }

    const auto& record = loaded.value();
    if (!record) {
        return clean(max_attempts);
    }
    return clean(std::max(0, max_attempts - record->count));
}

Outcome<seconds> AttemptTracker::wait_time(const std::string& key, milliseconds window) {
    auto loaded = load(keys_.rate(key));
    if (loaded.is_error()) {
        report_fault("wait_time", key, loaded.error());
        return degraded(std::chrono::ceil<seconds>(window), loaded.error());
    }

    const auto& record = loaded.value();
    if (!record) {
        return clean(seconds{0});
    }
    return clean(seconds_until(record->first_attempt_at + window, clock_.now()));
}

Outcome<seconds> AttemptTracker::wait_time(const std::string& key, const RateLimitPolicy& policy) {
    return wait_time(key, policy.window);
}

Outcome<std::size_t> AttemptTracker::clear_expired_records(milliseconds retention) {
    const auto prefix = keys_.rate_prefix();

    auto listed = store::KeySpace::keys_under(store_, prefix);
    if (listed.is_error()) {
        report_fault("clear_expired_records", prefix, listed.error());
        return degraded<std::size_t>(0, listed.error());
    }

    const auto now = clock_.now();
    std::vector<KeyedMutex::Guard> held;
    std::vector<std::string> stale;
    std::optional<Error> fault;
    events::AttemptRecordsSweptEvent summary;

    // Keys are sorted, so concurrent sweeps take the per-key locks in the
    // same order. Stale keys stay locked until they are removed.
    for (const auto& storage_key : listed.value()) {
        const auto key = storage_key.substr(prefix.size());
        auto guard = locks_.acquire(key);

        auto raw = store_.get(storage_key);
        if (raw.is_error()) {
            report_fault("clear_expired_records", key, raw.error());
            fault = raw.error();
            ++summary.kept;
            continue;
        }
        if (!raw.value()) {
            continue;
        }

        auto decoded = decode_attempt_record(*raw.value());
        if (decoded.is_error()) {
            ++summary.corrupt;
        } else if (decoded.value().age(now) <= retention) {
            ++summary.kept;
            continue;
        }

        stale.push_back(storage_key);
        held.push_back(std::move(guard));
    }

    if (!stale.empty()) {
        if (auto removed = store_.remove_many(stale); removed.is_error()) {
            report_fault("clear_expired_records", prefix, removed.error());
            return degraded<std::size_t>(0, removed.error());
        }
    }

    summary.removed = stale.size();
    bus_.emit(summary);

    if (fault) {
        return degraded(stale.size(), *fault);
    }
    return clean(stale.size());
}

Outcome<std::size_t> AttemptTracker::clear_expired_records() {
    return clear_expired_records(retention_);
}

Result<std::optional<AttemptRecord>, Error> AttemptTracker::load(const std::string& storage_key) {
    using Loaded = std::optional<AttemptRecord>;

    auto raw = store_.get(storage_key);
    if (raw.is_error()) {
        return Err<Loaded>(raw.error());
    }
    if (!raw.value()) {
        return Ok<Loaded, Error>(std::nullopt);
    }

    auto decoded = decode_attempt_record(*raw.value());
    if (decoded.is_error()) {
        return Err<Loaded>(decoded.error());
    }
    return Ok<Loaded, Error>(decoded.value());
}

void AttemptTracker::report_fault(const char* operation, const std::string& key, const Error& error) {
    spdlog::error("AttemptTracker::{} failed for {}: {}", operation, redact::identifier(key), describe(error));
    bus_.emit(events::StorageFaultEvent{"attempt_tracker", operation, error});
}

} // namespace holdfast
