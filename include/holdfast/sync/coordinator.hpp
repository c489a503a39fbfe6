#pragma once

/**
 * @file coordinator.hpp
 * @brief Drains the sync queue against the remote when connectivity allows
 *
 * HOW A DRAIN WORKS:
 * 1. Skip when another drain is in flight (AlreadyRunning) or when offline
 * 2. Take a snapshot of the queue
 * 3. Apply each operation in FIFO order, one at a time
 *    - success: remove it
 *    - failure, exception or timeout: SyncQueue::record_failure()
 * 4. Write lastSyncAt, whatever the individual outcomes were
 *
 * A failing operation never blocks the ones behind it; it only spends one
 * of its own attempts per drain.
 *
 * APPLY TIMEOUT:
 * Each apply runs on its own thread and is abandoned after
 * Config::sync.apply_timeout. The timed-out operation spends an attempt and
 * the drain stops there; the operations behind it stay queued untouched
 * (DrainReport::deferred). The abandoned call keeps running with its own copy
 * of the operation and holds the in-flight flag until it returns, so
 * draining() stays true and every drain() in the meantime is AlreadyRunning.
 * Two applies never run at once. The apply function must not capture
 * anything that dies before it returns.
 */

#include "holdfast/core/clock.hpp"
#include "holdfast/core/config.hpp"
#include "holdfast/events/event_bus.hpp"
#include "holdfast/net/connectivity.hpp"
#include "holdfast/sync/queue.hpp"
#include "holdfast/sync/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>

namespace holdfast::sync {

class SyncCoordinator {
public:
    SyncCoordinator(SyncQueue& queue,
                    net::ConnectivityMonitor& monitor,
                    const Clock& clock,
                    events::EventBus& bus,
                    const Config& config = Config{});

    /// Drain using the connectivity monitor's current status
    DrainReport drain(const ApplyFn& apply);

    DrainReport drain(const ApplyFn& apply, const OnlineFn& is_online);

    bool is_offline_mode() const { return !monitor_.current_status(); }

    /// True during a drain and while a timed-out apply is still running
    bool draining() const { return draining_->load(); }

private:
    class InFlight;

    Result<void, Error> apply_one(const ApplyFn& apply,
                                  const SyncOperation& operation,
                                  const std::shared_ptr<InFlight>& in_flight,
                                  bool& abandoned) const;

    SyncQueue& queue_;
    net::ConnectivityMonitor& monitor_;
    const Clock& clock_;
    events::EventBus& bus_;
    std::chrono::milliseconds apply_timeout_;

    // Shared with apply threads that may outlive the coordinator
    std::shared_ptr<std::atomic<bool>> draining_ = std::make_shared<std::atomic<bool>>(false);
};

} // namespace holdfast::sync
