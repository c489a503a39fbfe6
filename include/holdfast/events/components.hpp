/**
 * @file components.hpp
 * @brief Ready-made subscribers for the resilience layer's events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Tracker, cache and sync queue events are now logged and counted
 */

#pragma once

#include "holdfast/core/redact.hpp"
#include "holdfast/events/event_bus.hpp"
#include "holdfast/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace holdfast::events {

/**
 * @brief Logs every domain event through spdlog
 *
 * Rate-limit keys are masked with redact::identifier() before they reach
 * the log.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        listen<AttemptRecordedEvent>([](const AttemptRecordedEvent& e) {
            spdlog::debug("[AttemptRecorded] key={} count={}", redact::identifier(e.key), e.count);
        });

        listen<RateLimitExceededEvent>([](const RateLimitExceededEvent& e) {
            spdlog::warn("[RateLimitExceeded] key={} count={} retry_after={}s",
                         redact::identifier(e.key), e.count, e.retry_after.count());
        });

        listen<AttemptsResetEvent>([](const AttemptsResetEvent& e) {
            spdlog::debug("[AttemptsReset] key={}", redact::identifier(e.key));
        });

        listen<AttemptRecordsSweptEvent>([](const AttemptRecordsSweptEvent& e) {
            spdlog::info("[AttemptRecordsSwept] removed={} corrupt={} kept={}", e.removed, e.corrupt, e.kept);
        });

        listen<CacheEntryExpiredEvent>([](const CacheEntryExpiredEvent& e) {
            spdlog::debug("[CacheExpired] key={} age={}ms", e.key, e.age.count());
        });

        listen<OperationEnqueuedEvent>([](const OperationEnqueuedEvent& e) {
            spdlog::info("[OperationEnqueued] id={} kind={} queue_length={}", e.id, e.kind, e.queue_length);
        });

        listen<OperationAppliedEvent>([](const OperationAppliedEvent& e) {
            spdlog::info("[OperationApplied] id={} kind={} previous_failures={}", e.id, e.kind, e.attempts);
        });

        listen<OperationRetryScheduledEvent>([](const OperationRetryScheduledEvent& e) {
            spdlog::warn("[OperationRetry] id={} kind={} attempt={}/{} error={}",
                         e.id, e.kind, e.attempts, e.max_attempts, describe(e.error));
        });

        listen<OperationDroppedEvent>([](const OperationDroppedEvent& e) {
            spdlog::error("[OperationDropped] id={} kind={} attempts={} error={}",
                          e.id, e.kind, e.attempts, describe(e.error));
        });

        listen<DrainCompletedEvent>([](const DrainCompletedEvent& e) {
            const auto& r = e.report;
            spdlog::info("[DrainCompleted] status={} applied={} retried={} dropped={} deferred={} storage_faults={}",
                         sync::to_string(r.status), r.applied, r.retried, r.dropped, r.deferred,
                         r.storage_faults);
        });

        listen<StorageFaultEvent>([](const StorageFaultEvent& e) {
            spdlog::error("[StorageFault] component={} operation={} error={}",
                          e.component, e.operation, describe(e.error));
        });
    }

    ~LoggerComponent() {
        for (auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    template<typename EventType>
    void listen(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Metrics component - counts what the resilience layer did
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * const auto& stats = metrics.get_stats();
 * if (stats.operations_dropped.load() > 0) { ... }
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> attempts_recorded{0};
        std::atomic<uint64_t> limits_exceeded{0};
        std::atomic<uint64_t> attempt_resets{0};
        std::atomic<uint64_t> records_swept{0};
        std::atomic<uint64_t> cache_expirations{0};
        std::atomic<uint64_t> operations_enqueued{0};
        std::atomic<uint64_t> operations_applied{0};
        std::atomic<uint64_t> operations_retried{0};
        std::atomic<uint64_t> operations_dropped{0};
        std::atomic<uint64_t> drains_completed{0};
        std::atomic<uint64_t> storage_faults{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        count<AttemptRecordedEvent>(stats_.attempts_recorded);
        count<RateLimitExceededEvent>(stats_.limits_exceeded);
        count<AttemptsResetEvent>(stats_.attempt_resets);
        count<CacheEntryExpiredEvent>(stats_.cache_expirations);
        count<OperationEnqueuedEvent>(stats_.operations_enqueued);
        count<OperationAppliedEvent>(stats_.operations_applied);
        count<OperationRetryScheduledEvent>(stats_.operations_retried);
        count<OperationDroppedEvent>(stats_.operations_dropped);
        count<StorageFaultEvent>(stats_.storage_faults);

        subscribe<AttemptRecordsSweptEvent>([this](const AttemptRecordsSweptEvent& e) {
            stats_.records_swept += e.removed;
        });

        subscribe<DrainCompletedEvent>([this](const DrainCompletedEvent& e) {
            if (e.report.status == sync::DrainStatus::Completed) {
                stats_.drains_completed++;
            }
        });
    }

    ~MetricsComponent() {
        for (auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const { return stats_; }

    void log_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Resilience layer statistics:");
        spdlog::info("  Attempts recorded: {}", stats_.attempts_recorded.load());
        spdlog::info("  Limits exceeded:   {}", stats_.limits_exceeded.load());
        spdlog::info("  Records swept:     {}", stats_.records_swept.load());
        spdlog::info("  Cache expirations: {}", stats_.cache_expirations.load());
        spdlog::info("  Ops enqueued:      {}", stats_.operations_enqueued.load());
        spdlog::info("  Ops applied:       {}", stats_.operations_applied.load());
        spdlog::info("  Ops retried:       {}", stats_.operations_retried.load());
        spdlog::info("  Ops dropped:       {}", stats_.operations_dropped.load());
        spdlog::info("  Drains completed:  {}", stats_.drains_completed.load());
        spdlog::info("  Storage faults:    {}", stats_.storage_faults.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    template<typename EventType>
    void subscribe(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    template<typename EventType>
    void count(std::atomic<uint64_t>& counter) {
        subscribe<EventType>([&counter](const EventType&) { counter++; });
    }

    EventBus& bus_;
    Stats stats_;
    std::vector<std::function<void()>> unsubscribers_;
};

} // namespace holdfast::events
