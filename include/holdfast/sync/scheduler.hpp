#pragma once

/**
 * @file scheduler.hpp
 * @brief Runs drains on a worker thread when connectivity comes back
 *
 * WHY THIS FILE EXISTS:
 * Connectivity callbacks arrive on the monitor's thread and the application
 * asks for a sync from its UI thread. Neither should run a drain inline.
 * Both push a request here; one worker runs the drains one after another.
 *
 * COALESCING:
 * At most one request waits in the queue. Requests made while one is
 * already waiting are merged into it. A request made while a drain runs
 * queues exactly one follow-up drain.
 *
 * EXAMPLE:
 * SyncScheduler scheduler(coordinator, monitor, apply_to_server);
 * scheduler.start();           // drains now if online, then on reconnect
 * scheduler.request_drain();   // e.g. pull-to-refresh
 * scheduler.stop();
 */

#include "holdfast/core/thread_safe_queue.hpp"
#include "holdfast/net/connectivity.hpp"
#include "holdfast/sync/coordinator.hpp"
#include "holdfast/sync/types.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace holdfast::sync {

class SyncScheduler {
public:
    using ReportFn = std::function<void(const DrainReport&)>;

    SyncScheduler(SyncCoordinator& coordinator,
                  net::ConnectivityMonitor& monitor,
                  ApplyFn apply,
                  ReportFn on_report = nullptr);
    ~SyncScheduler();

    SyncScheduler(const SyncScheduler&) = delete;
    SyncScheduler& operator=(const SyncScheduler&) = delete;

    /// Start the worker and watch connectivity; requests a drain if online
    void start();

    /// Stop accepting requests and join the worker after the current drain
    void stop();

    /**
     * @return false when the scheduler is not running
     */
    bool request_drain();

    bool running() const { return running_.load(); }

    /// Drains the worker has finished since construction
    std::size_t drains_run() const { return drains_run_.load(); }

private:
    struct DrainRequest {
        std::string reason;
    };

    bool enqueue_request(const char* reason);
    void on_status(bool online);
    void worker_loop(ThreadSafeQueue<DrainRequest>* requests);

    SyncCoordinator& coordinator_;
    net::ConnectivityMonitor& monitor_;
    ApplyFn apply_;
    ReportFn on_report_;

    std::mutex lifecycle_mutex_;  // start/stop
    std::mutex request_mutex_;    // requests_ and running_ transitions
    std::unique_ptr<ThreadSafeQueue<DrainRequest>> requests_;
    std::thread worker_;
    net::Subscription subscription_;

    std::atomic<bool> running_{false};
    std::atomic<bool> pending_{false};
    std::atomic<bool> last_online_{false};
    std::atomic<std::size_t> drains_run_{0};
};

} // namespace holdfast::sync
