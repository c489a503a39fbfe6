#pragma once

/**
 * @file attempt_tracker.hpp
 * @brief Brute-force throttling for sensitive actions
 *
 * WHAT PROBLEM IT SOLVES:
 * Login, password reset and registration can be hammered from the client.
 * The tracker counts attempts per opaque key ("login:<email>") inside a
 * window and denies once the count reaches the limit.
 *
 * FAILURE POLICY (fail-secure):
 * Every read failure turns into the restrictive answer. check_limit()
 * denies, remaining_attempts() reports 0 and wait_time() reports the whole
 * window. The fault is attached to the answer and logged; nothing throws.
 *
 * CALLER CONTRACT:
 * Only check_limit() grants permission. remaining_attempts() and
 * wait_time() are for display.
 *
 * TYPICAL FLOW:
 * auto allowed = tracker.check_limit(key, policies::kLogin);
 * if (!allowed.value) { show wait_time(key, ...); return; }
 * if (login(...)) tracker.reset_attempts(key);
 * else tracker.record_attempt(key);
 */

#include "holdfast/core/clock.hpp"
#include "holdfast/core/config.hpp"
#include "holdfast/core/result.hpp"
#include "holdfast/core/keyed_mutex.hpp"
#include "holdfast/events/event_bus.hpp"
#include "holdfast/ratelimit/attempt_record.hpp"
#include "holdfast/ratelimit/policy.hpp"
#include "holdfast/store/durable_store.hpp"
#include "holdfast/store/key_space.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace holdfast {

class AttemptTracker {
public:
    AttemptTracker(store::DurableStore& store,
                   const Clock& clock,
                   events::EventBus& bus,
                   const Config& config = Config{});

    /**
     * @brief May the action for @p key proceed?
     *
     * - no record: allowed
     * - window elapsed (age >= window): record deleted, allowed
     * - count >= max_attempts inside the window: denied
     * - unreadable or corrupt record: denied, fault attached
     */
    Outcome<bool> check_limit(const std::string& key, int max_attempts, std::chrono::milliseconds window);
    Outcome<bool> check_limit(const std::string& key, const RateLimitPolicy& policy);

    /**
     * @brief Count one attempt; creates the record with count 1 when absent
     *
     * first_attempt_at is preserved. A corrupt record is replaced by a fresh
     * one. The returned error is informational; the caller's flow continues.
     */
    Result<void, Error> record_attempt(const std::string& key);

    /// Delete the record; idempotent
    Result<void, Error> reset_attempts(const std::string& key);

    Outcome<int> remaining_attempts(const std::string& key, int max_attempts);

    /// Whole seconds (rounded up) until the window closes; 0 when closed
    Outcome<std::chrono::seconds> wait_time(const std::string& key, std::chrono::milliseconds window);
    Outcome<std::chrono::seconds> wait_time(const std::string& key, const RateLimitPolicy& policy);

    /**
     * @brief Maintenance sweep over every rate-limit record
     *
     * Removes records older than @p retention and records that do not
     * decode. A record younger than @p retention is kept even if its own
     * window has passed or it is currently blocking, so a bulk clear can
     * never be used to lift an active block.
     *
     * @return number of records removed
     */
    Outcome<std::size_t> clear_expired_records(std::chrono::milliseconds retention);

    /// Sweep with the configured retention floor (24 hours by default)
    Outcome<std::size_t> clear_expired_records();

private:
    Result<std::optional<AttemptRecord>, Error> load(const std::string& storage_key);

    void report_fault(const char* operation, const std::string& key, const Error& error);

    store::DurableStore& store_;
    const Clock& clock_;
    events::EventBus& bus_;
    store::KeySpace keys_;
    std::chrono::milliseconds retention_;
    KeyedMutex locks_;
};

} // namespace holdfast
