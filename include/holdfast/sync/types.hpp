#pragma once

#include "holdfast/core/clock.hpp"
#include "holdfast/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace holdfast::sync {

/**
 * @brief One locally-originated mutation waiting for the remote system
 *
 * Lifecycle: Pending -> Applied (removed) | Pending (attempts + 1) |
 * Dropped (removed once attempts reaches max_attempts).
 */
struct SyncOperation {
    std::string id;
    std::string kind;                 ///< Discriminator, e.g. "CREATE_CARD"
    nlohmann::json payload = nlohmann::json::object();
    TimePoint enqueued_at{};
    int attempts = 0;
    int max_attempts = 3;
    std::optional<std::string> last_error;
};

// Wire names follow the queue's stored JSON: id, kind, payload, enqueuedAt,
// attempts, maxAttempts, lastError.
void to_json(nlohmann::json& j, const SyncOperation& operation);
void from_json(const nlohmann::json& j, SyncOperation& operation);

/**
 * @brief What happened to an operation after a failed apply
 */
enum class OperationFate {
    Retry,    ///< Still queued with attempts incremented
    Dropped,  ///< Retry budget exhausted, removed from the queue
    Gone      ///< No longer in the queue (cleared concurrently)
};

enum class DrainStatus {
    Completed,       ///< A full pass ran; lastSyncAt was written unless storage_faults says otherwise
    Offline,         ///< Skipped, connectivity reported offline
    AlreadyRunning,  ///< Skipped, another drain holds the lock
    StorageFault     ///< The queue could not be read
};

const char* to_string(DrainStatus status) noexcept;

/**
 * @brief Summary of one drain() call
 */
struct DrainReport {
    DrainStatus status = DrainStatus::Completed;
    std::size_t applied = 0;
    std::size_t retried = 0;
    std::size_t dropped = 0;
    std::size_t storage_faults = 0;  ///< Queue updates that could not be persisted
    std::size_t deferred = 0;        ///< Left untouched behind a timed-out apply
    TimePoint started_at{};
    TimePoint finished_at{};

    [[nodiscard]] std::size_t processed() const noexcept { return applied + retried + dropped; }
    [[nodiscard]] bool clean() const noexcept {
        return status == DrainStatus::Completed && retried == 0 && dropped == 0 && deferred == 0 &&
               storage_faults == 0;
    }
};

/// Remote apply: success, or failure with a reason
using ApplyFn = std::function<Result<void, std::string>(const SyncOperation&)>;

using OnlineFn = std::function<bool()>;

} // namespace holdfast::sync
