#include "holdfast/net/connectivity.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace holdfast::net;
using std::chrono::milliseconds;

namespace {

// Collects notifications from any thread
class Recorder {
public:
    void operator()(bool online) {
        std::lock_guard lock(mutex_);
        seen_.push_back(online);
        cv_.notify_all();
    }

    bool wait_for_count(std::size_t n, milliseconds timeout = milliseconds(2000)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return seen_.size() >= n; });
    }

    std::vector<bool> seen() {
        std::lock_guard lock(mutex_);
        return seen_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<bool> seen_;
};

} // namespace

TEST(ManualConnectivityMonitorTest, NotifiesOnChangesOnly) {
    ManualConnectivityMonitor monitor(false);
    std::vector<bool> seen;
    auto subscription = monitor.subscribe([&](bool online) { seen.push_back(online); });

    monitor.set_online(false);  // No change
    monitor.set_online(true);
    monitor.set_online(true);   // No change
    monitor.set_online(false);

    EXPECT_EQ(seen, (std::vector<bool>{true, false}));
    EXPECT_FALSE(monitor.current_status());
}

TEST(ManualConnectivityMonitorTest, UnsubscribeDetaches) {
    ManualConnectivityMonitor monitor(true);
    int calls = 0;

    auto subscription = monitor.subscribe([&](bool) { calls++; });
    EXPECT_TRUE(subscription.active());
    EXPECT_EQ(monitor.subscriber_count(), 1u);

    monitor.set_online(false);
    subscription.unsubscribe();
    EXPECT_FALSE(subscription.active());
    monitor.set_online(true);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(monitor.subscriber_count(), 0u);
}

TEST(ManualConnectivityMonitorTest, SubscriptionDetachesWhenDestroyed) {
    ManualConnectivityMonitor monitor(true);
    int calls = 0;
    {
        auto subscription = monitor.subscribe([&](bool) { calls++; });
        monitor.set_online(false);
    }
    monitor.set_online(true);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(monitor.subscriber_count(), 0u);
}

TEST(ManualConnectivityMonitorTest, SubscriptionMayOutliveMonitor) {
    Subscription subscription;
    {
        ManualConnectivityMonitor monitor(true);
        subscription = monitor.subscribe([](bool) {});
    }
    EXPECT_NO_THROW(subscription.unsubscribe());
}

TEST(ManualConnectivityMonitorTest, UnsubscribeWaitsForRunningCallback) {
    ManualConnectivityMonitor monitor(false);
    std::promise<void> entered;
    std::atomic<bool> finished{false};

    auto subscription = monitor.subscribe([&](bool) {
        entered.set_value();
        std::this_thread::sleep_for(milliseconds(100));
        finished = true;
    });

    std::thread notifier([&]() { monitor.set_online(true); });
    entered.get_future().wait();

    subscription.unsubscribe();
    EXPECT_TRUE(finished.load());
    notifier.join();
}

TEST(ManualConnectivityMonitorTest, CallbackDetachedDuringNotifyIsSkipped) {
    ManualConnectivityMonitor monitor(false);
    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    std::atomic<int> later_calls{0};

    auto slow = monitor.subscribe([&](bool) {
        entered.set_value();
        release_future.wait();
    });
    auto later = monitor.subscribe([&](bool) { later_calls++; });

    std::thread notifier([&]() { monitor.set_online(true); });
    entered.get_future().wait();

    later.unsubscribe();  // Not running yet, returns at once
    release.set_value();
    notifier.join();

    EXPECT_EQ(later_calls.load(), 0);
}

TEST(ManualConnectivityMonitorTest, CallbackMayUnsubscribeItself) {
    ManualConnectivityMonitor monitor(false);
    int calls = 0;
    Subscription self;

    self = monitor.subscribe([&](bool) {
        calls++;
        self.unsubscribe();
    });

    monitor.set_online(true);
    monitor.set_online(false);

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(self.active());
    EXPECT_EQ(monitor.subscriber_count(), 0u);
}

TEST(ManualConnectivityMonitorTest, ThrowingCallbackDoesNotStopOthers) {
    ManualConnectivityMonitor monitor(false);
    int calls = 0;

    auto bad = monitor.subscribe([](bool) { throw std::runtime_error("listener failed"); });
    auto good = monitor.subscribe([&](bool) { calls++; });

    EXPECT_NO_THROW(monitor.set_online(true));
    EXPECT_EQ(calls, 1);
}

TEST(PollingConnectivityMonitorTest, ReportsCheckTransitions) {
    std::atomic<bool> reachable{true};
    PollingConnectivityMonitor monitor([&]() { return reachable.load(); }, milliseconds(5));

    Recorder recorder;
    auto subscription = monitor.subscribe([&](bool online) { recorder(online); });

    EXPECT_FALSE(monitor.current_status());  // Offline until the first check
    monitor.start();
    EXPECT_TRUE(monitor.running());

    ASSERT_TRUE(recorder.wait_for_count(1));
    EXPECT_TRUE(monitor.current_status());

    reachable = false;
    ASSERT_TRUE(recorder.wait_for_count(2));
    EXPECT_FALSE(monitor.current_status());

    monitor.stop();
    EXPECT_FALSE(monitor.running());
    EXPECT_EQ(recorder.seen(), (std::vector<bool>{true, false}));
}

TEST(PollingConnectivityMonitorTest, ThrowingCheckCountsAsOffline) {
    std::atomic<int> checks{0};
    PollingConnectivityMonitor monitor([&]() -> bool {
        checks++;
        throw std::runtime_error("dns failure");
    }, milliseconds(5));

    monitor.start();
    while (checks.load() < 3) {
        std::this_thread::sleep_for(milliseconds(1));
    }
    monitor.stop();

    EXPECT_FALSE(monitor.current_status());
}

TEST(PollingConnectivityMonitorTest, StopIsPromptAndRepeatable) {
    PollingConnectivityMonitor monitor([]() { return true; }, std::chrono::hours(1));
    monitor.start();

    const auto start = std::chrono::steady_clock::now();
    monitor.stop();
    monitor.stop();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::seconds(5));
}
