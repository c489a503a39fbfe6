#pragma once

/**
 * @file connectivity.hpp
 * @brief Online/offline signal consumed by the sync coordinator and scheduler
 *
 * WHY THIS FILE EXISTS:
 * The layer never talks to the network itself. Something outside (a
 * platform reachability listener, a health check, a test) decides
 * whether the remote is reachable. This interface is how that answer gets in.
 *
 * IMPLEMENTATIONS:
 * - ManualConnectivityMonitor: the application pushes the status
 * - PollingConnectivityMonitor: runs a caller-supplied reachability check periodically
 *
 * EXAMPLE:
 * ManualConnectivityMonitor monitor(false);
 * auto subscription = monitor.subscribe([](bool online) {
 *     spdlog::info("online={}", online);
 * });
 * monitor.set_online(true);   // callback fires
 * subscription.unsubscribe(); // or let it go out of scope
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace holdfast::net {

using StatusCallback = std::function<void(bool online)>;

/**
 * @brief RAII handle for a status callback
 *
 * Destroying the handle or calling unsubscribe() detaches the callback.
 * When unsubscribe() returns, the callback is not running on any other
 * thread and will not be called again, so whatever it captured may be
 * destroyed. Safe to outlive the monitor that issued it.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}

    ~Subscription() { unsubscribe(); }

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
        other.cancel_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void unsubscribe() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    bool active() const noexcept { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

class ConnectivityMonitor {
public:
    ConnectivityMonitor();
    virtual ~ConnectivityMonitor() = default;

    ConnectivityMonitor(const ConnectivityMonitor&) = delete;
    ConnectivityMonitor& operator=(const ConnectivityMonitor&) = delete;

    virtual bool current_status() const = 0;

    /**
     * @brief Call @p callback on every status change
     *
     * Callbacks run on the thread that observed the change. They must not
     * block for long; the scheduler hands the work to its own thread.
     */
    Subscription subscribe(StatusCallback callback);

    std::size_t subscriber_count() const;

protected:
    /// Deliver @p online to every subscriber
    void notify(bool online);

private:
    // One per subscription. call_mutex is held while the callback runs and
    // while it is retired; recursive so a callback may unsubscribe itself.
    struct Slot {
        explicit Slot(StatusCallback fn) : callback(std::move(fn)) {}

        std::recursive_mutex call_mutex;
        bool alive = true;
        StatusCallback callback;
    };

    struct Registry {
        mutable std::mutex mutex;
        std::map<std::size_t, std::shared_ptr<Slot>> slots;
        std::size_t next_id = 0;
    };

    std::shared_ptr<Registry> registry_;
};

/**
 * @brief Status set explicitly by the application
 *
 * Notifies only when the status actually changes.
 */
class ManualConnectivityMonitor : public ConnectivityMonitor {
public:
    explicit ManualConnectivityMonitor(bool online = true) : online_(online) {}

    bool current_status() const override { return online_.load(); }

    void set_online(bool online);

private:
    std::atomic<bool> online_;
    std::mutex transition_mutex_;
};

/**
 * @brief Checks reachability on a background thread
 *
 * The status starts offline. The first check that succeeds is reported as a
 * change, so subscribers see the initial transition to online.
 */
class PollingConnectivityMonitor : public ConnectivityMonitor {
public:
    using ReachabilityCheck = std::function<bool()>;

    PollingConnectivityMonitor(ReachabilityCheck check, std::chrono::milliseconds interval);
    ~PollingConnectivityMonitor() override;

    void start();
    void stop();

    bool running() const { return running_.load(); }

    bool current_status() const override { return online_.load(); }

private:
    void monitor_loop();
    bool run_check();

    ReachabilityCheck check_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> online_{false};
    std::atomic<bool> running_{false};
    std::thread monitor_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;
};

} // namespace holdfast::net
