/**
 * @file events.hpp
 * @brief Event types emitted by the resilience layer
 *
 * NAMING CONVENTION:
 * - Events are past-tense: AttemptRecordedEvent, OperationDroppedEvent
 *
 * Keys carried by rate-limit events are the caller's raw identifiers
 * (often containing an e-mail address). Subscribers that write them
 * anywhere must pass them through redact::identifier().
 */

#pragma once

#include "holdfast/core/clock.hpp"
#include "holdfast/core/error.hpp"
#include "holdfast/sync/types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace holdfast::events {

// ════════════════════════════════════════════════════════
// Rate limiting
// ════════════════════════════════════════════════════════

struct AttemptRecordedEvent {
    std::string key;
    int count = 0;
};

/**
 * @brief Emitted when check_limit() denies an action inside an active window
 *
 * WHO SUBSCRIBES:
 * - Logger (warn with masked key and retry-after)
 * - Metrics (count denials)
 */
struct RateLimitExceededEvent {
    std::string key;
    int count = 0;
    std::chrono::seconds retry_after{0};
};

struct AttemptsResetEvent {
    std::string key;
};

struct AttemptRecordsSweptEvent {
    std::size_t removed = 0;
    std::size_t corrupt = 0;
    std::size_t kept = 0;
};

// ════════════════════════════════════════════════════════
// Cache
// ════════════════════════════════════════════════════════

struct CacheEntryExpiredEvent {
    std::string key;
    std::chrono::milliseconds age{0};
};

// ════════════════════════════════════════════════════════
// Sync queue
// ════════════════════════════════════════════════════════

struct OperationEnqueuedEvent {
    std::string id;
    std::string kind;
    std::size_t queue_length = 0;
};

struct OperationAppliedEvent {
    std::string id;
    std::string kind;
    int attempts = 0;  ///< Failed attempts before this success
};

struct OperationRetryScheduledEvent {
    std::string id;
    std::string kind;
    int attempts = 0;
    int max_attempts = 0;
    Error error;
};

/**
 * @brief Emitted when an operation exhausts its retry budget
 *
 * The operation is gone from the queue when this fires.
 */
struct OperationDroppedEvent {
    std::string id;
    std::string kind;
    int attempts = 0;
    Error error;
};

struct DrainCompletedEvent {
    sync::DrainReport report;
};

// ════════════════════════════════════════════════════════
// Storage
// ════════════════════════════════════════════════════════

/**
 * @brief A component absorbed a store failure into its fail-secure or
 *        fail-empty answer
 */
struct StorageFaultEvent {
    std::string component;  ///< "attempt_tracker", "cache", "sync_queue"
    std::string operation;
    Error error;
};

} // namespace holdfast::events
