#pragma once

/**
 * @file queue.hpp
 * @brief Durable FIFO of mutations made while offline
 *
 * WHY THIS FILE EXISTS:
 * A card created on a plane has to reach the server eventually. The queue
 * keeps every such mutation in the durable store, in the order the user
 * made them, with the retry bookkeeping the coordinator needs.
 *
 * STORAGE:
 * The whole queue is one JSON array under KeySpace::sync_queue(). Every
 * mutation is load, change, store under the queue mutex, so concurrent
 * enqueues never lose an element.
 *
 * CORRUPTION:
 * A stored queue that does not parse is copied to a quarantine key and a
 * fresh queue is started. Offline writes keep being accepted; the damaged
 * payload stays available for inspection.
 *
 * EVENTS:
 * StorageFaultEvent is emitted only after the queue mutex is released, so a
 * subscriber may call back into the queue.
 */

#include "holdfast/core/clock.hpp"
#include "holdfast/core/config.hpp"
#include "holdfast/core/result.hpp"
#include "holdfast/events/event_bus.hpp"
#include "holdfast/store/durable_store.hpp"
#include "holdfast/store/key_space.hpp"
#include "holdfast/sync/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace holdfast::sync {

class SyncQueue {
public:
    SyncQueue(store::DurableStore& store,
              const Clock& clock,
              events::EventBus& bus,
              const Config& config = Config{});

    /**
     * @brief Append a new operation (attempts 0, fresh id)
     *
     * @param payload must be a JSON object
     * @return the operation as persisted
     */
    Result<SyncOperation, Error> enqueue(const std::string& kind, nlohmann::json payload);

    /// Pending operations in FIFO order
    Result<std::vector<SyncOperation>, Error> snapshot();

    Result<std::size_t, Error> size();

    /// Remove after a successful apply; an absent id is not an error
    Result<void, Error> remove(const std::string& id);

    /**
     * @brief Count one failed apply
     *
     * attempts + 1 and last_error are stored. Once attempts reaches
     * max_attempts the operation is removed and Dropped is returned.
     */
    Result<OperationFate, Error> record_failure(const std::string& id, const Error& error);

    Result<void, Error> clear();

    Result<void, Error> mark_synced(TimePoint when);

    /// Time of the last completed drain, std::nullopt before the first one
    Result<std::optional<TimePoint>, Error> last_sync_time();

private:
    Result<std::vector<SyncOperation>, Error> load_locked();
    Result<void, Error> store_locked(const std::vector<SyncOperation>& operations);
    Result<std::vector<SyncOperation>, Error> quarantine_locked(const std::string& raw, const std::string& reason);

    std::string generate_id();

    struct PendingFault {
        const char* operation;
        Error error;
    };

    // Declared before the lock_guard so it runs after the mutex is released
    struct PublishFaultsOnExit {
        SyncQueue& queue;
        ~PublishFaultsOnExit() { queue.publish_faults(); }
    };

    void report_fault(const char* operation, const Error& error);
    void report_fault_locked(const char* operation, const Error& error);
    void publish_faults();

    store::DurableStore& store_;
    const Clock& clock_;
    events::EventBus& bus_;
    store::KeySpace keys_;
    int max_attempts_;

    std::mutex mutex_;
    std::mt19937_64 rng_;                         // guarded by mutex_
    std::vector<PendingFault> pending_faults_;    // guarded by mutex_
};

} // namespace holdfast::sync
