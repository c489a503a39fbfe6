#include "holdfast/events/event_bus.hpp"
#include "holdfast/net/connectivity.hpp"
#include "holdfast/store/memory_store.hpp"
#include "holdfast/sync/coordinator.hpp"
#include "holdfast/sync/queue.hpp"
#include "holdfast/sync/scheduler.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace holdfast;
using holdfast::sync::DrainReport;
using holdfast::sync::DrainStatus;
using holdfast::sync::SyncCoordinator;
using holdfast::sync::SyncOperation;
using holdfast::sync::SyncQueue;
using holdfast::sync::SyncScheduler;
using json = nlohmann::json;
using std::chrono::milliseconds;

namespace {

// Thread-safe sink for reports delivered on the scheduler's worker
class ReportLog {
public:
    void add(const DrainReport& report) {
        std::lock_guard lock(mutex_);
        reports_.push_back(report);
        cv_.notify_all();
    }

    bool wait_for_count(std::size_t n, milliseconds timeout = milliseconds(5000)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return reports_.size() >= n; });
    }

    std::vector<DrainReport> reports() {
        std::lock_guard lock(mutex_);
        return reports_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<DrainReport> reports_;
};

class SyncSchedulerTest : public ::testing::Test {
protected:
    SyncScheduler::ReportFn log_reports() {
        return [this](const DrainReport& report) { log_.add(report); };
    }

    void enqueue(const std::string& kind) {
        ASSERT_TRUE(queue_.enqueue(kind, json::object()).is_ok());
    }

    store::MemoryStore store_;
    SystemClock clock_;
    events::EventBus bus_;
    net::ManualConnectivityMonitor monitor_{false};
    SyncQueue queue_{store_, clock_, bus_};
    SyncCoordinator coordinator_{queue_, monitor_, clock_, bus_};
    ReportLog log_;
    std::atomic<int> applied_{0};
};

} // namespace

TEST_F(SyncSchedulerTest, DrainsWhenConnectivityReturns) {
    enqueue("CREATE_CARD");

    SyncScheduler scheduler(coordinator_, monitor_, [this](const SyncOperation&) -> Result<void, std::string> {
        applied_++;
        return Ok();
    }, log_reports());
    scheduler.start();
    EXPECT_TRUE(scheduler.running());

    std::this_thread::sleep_for(milliseconds(20));
    EXPECT_EQ(scheduler.drains_run(), 0u);  // Offline: nothing scheduled

    monitor_.set_online(true);
    ASSERT_TRUE(log_.wait_for_count(1));

    auto reports = log_.reports();
    EXPECT_EQ(reports[0].status, DrainStatus::Completed);
    EXPECT_EQ(reports[0].applied, 1u);
    EXPECT_EQ(applied_.load(), 1);
    EXPECT_EQ(queue_.size().value(), 0u);

    scheduler.stop();
}

TEST_F(SyncSchedulerTest, DrainsOnStartWhenAlreadyOnline) {
    monitor_.set_online(true);
    enqueue("CREATE_CARD");

    SyncScheduler scheduler(coordinator_, monitor_, [](const SyncOperation&) -> Result<void, std::string> {
        return Ok();
    }, log_reports());
    scheduler.start();

    ASSERT_TRUE(log_.wait_for_count(1));
    EXPECT_EQ(log_.reports()[0].applied, 1u);
    scheduler.stop();
}

TEST_F(SyncSchedulerTest, GoingOfflineDoesNotDrain) {
    monitor_.set_online(true);
    SyncScheduler scheduler(coordinator_, monitor_, [](const SyncOperation&) -> Result<void, std::string> {
        return Ok();
    }, log_reports());
    scheduler.start();
    ASSERT_TRUE(log_.wait_for_count(1));  // Startup drain

    monitor_.set_online(false);
    std::this_thread::sleep_for(milliseconds(50));
    EXPECT_EQ(log_.reports().size(), 1u);

    monitor_.set_online(true);
    ASSERT_TRUE(log_.wait_for_count(2));
    scheduler.stop();
}

TEST_F(SyncSchedulerTest, RequestsDuringDrainCoalesceIntoOne) {
    monitor_.set_online(true);
    enqueue("CREATE_CARD");

    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    std::atomic<bool> first_call{true};

    SyncScheduler scheduler(coordinator_, monitor_, [&](const SyncOperation&) -> Result<void, std::string> {
        if (first_call.exchange(false)) {
            entered.set_value();
            release_future.wait();
        }
        return Ok();
    }, log_reports());
    scheduler.start();

    entered.get_future().wait();
    EXPECT_TRUE(scheduler.request_drain());
    EXPECT_TRUE(scheduler.request_drain());
    EXPECT_TRUE(scheduler.request_drain());
    release.set_value();

    ASSERT_TRUE(log_.wait_for_count(2));
    std::this_thread::sleep_for(milliseconds(100));

    EXPECT_EQ(log_.reports().size(), 2u);  // Startup drain plus one follow-up
    EXPECT_EQ(scheduler.drains_run(), 2u);
    scheduler.stop();
}

TEST_F(SyncSchedulerTest, StopRejectsFurtherRequests) {
    SyncScheduler scheduler(coordinator_, monitor_, [](const SyncOperation&) -> Result<void, std::string> {
        return Ok();
    });

    EXPECT_FALSE(scheduler.request_drain());  // Not started

    scheduler.start();
    EXPECT_TRUE(scheduler.request_drain());
    scheduler.stop();
    scheduler.stop();

    EXPECT_FALSE(scheduler.running());
    EXPECT_FALSE(scheduler.request_drain());
    EXPECT_EQ(monitor_.subscriber_count(), 0u);
}

TEST_F(SyncSchedulerTest, CanRestartAfterStop) {
    monitor_.set_online(true);
    SyncScheduler scheduler(coordinator_, monitor_, [](const SyncOperation&) -> Result<void, std::string> {
        return Ok();
    }, log_reports());

    scheduler.start();
    ASSERT_TRUE(log_.wait_for_count(1));
    scheduler.stop();

    scheduler.start();
    ASSERT_TRUE(log_.wait_for_count(2));
    scheduler.stop();
}

TEST_F(SyncSchedulerTest, DestroyedDuringStatusNotificationIsNotCalled) {
    // A slower subscriber ahead of the scheduler keeps notify() busy
    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    auto slow = monitor_.subscribe([&](bool) {
        entered.set_value();
        release_future.wait();
    });

    auto scheduler = std::make_unique<SyncScheduler>(
        coordinator_, monitor_,
        [](const SyncOperation&) -> Result<void, std::string> { return Ok(); },
        log_reports());
    scheduler->start();

    std::thread notifier([this]() { monitor_.set_online(true); });
    entered.get_future().wait();

    scheduler.reset();
    release.set_value();
    notifier.join();

    EXPECT_TRUE(log_.reports().empty());
    EXPECT_EQ(monitor_.subscriber_count(), 1u);
}

TEST_F(SyncSchedulerTest, DestructorStopsWorker) {
    {
        SyncScheduler scheduler(coordinator_, monitor_, [](const SyncOperation&) -> Result<void, std::string> {
            return Ok();
        });
        scheduler.start();
        EXPECT_EQ(monitor_.subscriber_count(), 1u);
    }
    EXPECT_EQ(monitor_.subscriber_count(), 0u);
}
