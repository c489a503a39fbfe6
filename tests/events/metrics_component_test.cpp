#include "holdfast/events/components.hpp"
#include "holdfast/events/event_bus.hpp"
#include "holdfast/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace holdfast;
using namespace holdfast::events;

TEST(MetricsComponentTest, TracksRateLimitAndCacheCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(AttemptRecordedEvent{"login:a@x.com", 1});
    bus.emit(AttemptRecordedEvent{"login:a@x.com", 2});
    bus.emit(RateLimitExceededEvent{"login:a@x.com", 5, std::chrono::seconds(600)});
    bus.emit(AttemptsResetEvent{"login:a@x.com"});
    bus.emit(AttemptRecordsSweptEvent{4, 1, 2});
    bus.emit(CacheEntryExpiredEvent{"cards", std::chrono::milliseconds(1500)});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.attempts_recorded.load(), 2u);
    EXPECT_EQ(stats.limits_exceeded.load(), 1u);
    EXPECT_EQ(stats.attempt_resets.load(), 1u);
    EXPECT_EQ(stats.records_swept.load(), 4u);
    EXPECT_EQ(stats.cache_expirations.load(), 1u);
}

TEST(MetricsComponentTest, TracksSyncCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(OperationEnqueuedEvent{"op-1", "CREATE_CARD", 1});
    bus.emit(OperationAppliedEvent{"op-1", "CREATE_CARD", 0});
    bus.emit(OperationRetryScheduledEvent{"op-2", "DELETE_CARD", 1, 3, Error{ErrorKind::ApplyFailure, "500"}});
    bus.emit(OperationDroppedEvent{"op-2", "DELETE_CARD", 3, Error{ErrorKind::RetryExhausted, "500"}});
    bus.emit(StorageFaultEvent{"sync_queue", "enqueue", Error::storage("disk full")});

    sync::DrainReport completed;
    completed.status = sync::DrainStatus::Completed;
    bus.emit(DrainCompletedEvent{completed});

    sync::DrainReport offline;
    offline.status = sync::DrainStatus::Offline;
    bus.emit(DrainCompletedEvent{offline});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.operations_enqueued.load(), 1u);
    EXPECT_EQ(stats.operations_applied.load(), 1u);
    EXPECT_EQ(stats.operations_retried.load(), 1u);
    EXPECT_EQ(stats.operations_dropped.load(), 1u);
    EXPECT_EQ(stats.storage_faults.load(), 1u);
    EXPECT_EQ(stats.drains_completed.load(), 1u);  // Offline skip does not count
}

TEST(MetricsComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<OperationDroppedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<OperationDroppedEvent>(), 0u);
    EXPECT_NO_THROW(bus.emit(OperationDroppedEvent{"op", "KIND", 3, Error{}}));
}
