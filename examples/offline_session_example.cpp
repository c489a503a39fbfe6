/**
 * @file offline_session_example.cpp
 * @brief A client session that loses and regains its connection
 *
 * WHAT IT SHOWS:
 * - Login throttling with the login preset (5 attempts per 15 minutes)
 * - Caching a card list for offline reads
 * - Queueing card mutations while offline
 * - The scheduler draining the queue once the connection comes back
 *
 * USAGE:
 * ./offline_session_example [state.json] [config.json]
 */

#include "holdfast/cache/cache_manager.hpp"
#include "holdfast/core/clock.hpp"
#include "holdfast/core/config.hpp"
#include "holdfast/core/logging.hpp"
#include "holdfast/events/components.hpp"
#include "holdfast/events/event_bus.hpp"
#include "holdfast/net/connectivity.hpp"
#include "holdfast/ratelimit/attempt_tracker.hpp"
#include "holdfast/store/file_store.hpp"
#include "holdfast/sync/coordinator.hpp"
#include "holdfast/sync/queue.hpp"
#include "holdfast/sync/scheduler.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace holdfast;
using json = nlohmann::json;

namespace {

bool attempt_login(AttemptTracker& tracker, const std::string& email, const std::string& password) {
    const auto key = "login:" + email;

    auto allowed = tracker.check_limit(key, policies::kLogin);
    if (!allowed.value) {
        auto wait = tracker.wait_time(key, policies::kLogin);
        spdlog::warn("Login blocked, try again in {}s", wait.value.count());
        return false;
    }

    // Stand-in for the real authentication call
    const bool accepted = password == "correct horse";
    if (accepted) {
        if (auto reset = tracker.reset_attempts(key); reset.is_error()) {
            spdlog::warn("Could not reset login attempts: {}", describe(reset.error()));
        }
    } else {
        if (auto recorded = tracker.record_attempt(key); recorded.is_error()) {
            spdlog::warn("Could not record login attempt: {}", describe(recorded.error()));
        }
        auto left = tracker.remaining_attempts(key, policies::kLogin.max_attempts);
        spdlog::info("Wrong password, {} attempts left", left.value);
    }
    return accepted;
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string state_path = argc > 1 ? argv[1] : "holdfast_state.json";

    Config config;
    if (argc > 2) {
        auto loaded = load_config(argv[2]);
        if (loaded.is_error()) {
            spdlog::error("Config error: {}", describe(loaded.error()));
            return 1;
        }
        config = loaded.value();
    }
    logging::init(config.logging);

    auto opened = store::FileStore::open(state_path);
    if (opened.is_error()) {
        spdlog::error("Cannot open {}: {}", state_path, describe(opened.error()));
        return 1;
    }
    auto& store = *opened.value();

    // ════════════════════════════════════════════════════════
    // Wiring
    // ════════════════════════════════════════════════════════

    SystemClock clock;
    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    net::ManualConnectivityMonitor monitor(false);

    AttemptTracker tracker(store, clock, bus, config);
    cache::CacheManager cache(store, clock, bus, config);
    sync::SyncQueue queue(store, clock, bus, config);
    sync::SyncCoordinator coordinator(queue, monitor, clock, bus, config);

    std::mutex done_mutex;
    std::condition_variable done;
    bool drained = false;

    sync::SyncScheduler scheduler(
        coordinator, monitor,
        [](const sync::SyncOperation& op) -> Result<void, std::string> {
            spdlog::info("Sending {} {}", op.kind, op.payload.dump());
            return Ok();
        },
        [&](const sync::DrainReport& report) {
            if (report.status != sync::DrainStatus::Completed) {
                return;
            }
            std::lock_guard lock(done_mutex);
            drained = true;
            done.notify_all();
        });
    scheduler.start();

    // ════════════════════════════════════════════════════════
    // Session
    // ════════════════════════════════════════════════════════

    attempt_login(tracker, "jane@example.com", "hunter2");
    attempt_login(tracker, "jane@example.com", "correct horse");

    std::vector<json> cards{
        {{"id", "c1"}, {"name", "Jane Doe"}, {"company", "Acme"}},
        {{"id", "c2"}, {"name", "John Roe"}, {"company", "Initech"}},
    };
    if (auto cached = cache.set("cards:list", cards, std::chrono::minutes(10)); cached.is_error()) {
        spdlog::warn("Card list not cached: {}", describe(cached.error()));
    }

    // Offline: reads come from the cache, writes go to the queue
    if (auto cached = cache.get<std::vector<json>>("cards:list")) {
        spdlog::info("Showing {} cached cards", cached->size());
    }

    json created{{"id", "c3"}, {"name", "Ada Lovelace"}};
    if (auto queued = queue.enqueue("CREATE_CARD", created); queued.is_error()) {
        spdlog::error("Card creation lost: {}", describe(queued.error()));
        return 1;
    }
    cache.update<std::vector<json>>("cards:list", [&](std::optional<std::vector<json>> current) {
        if (current) {
            current->push_back(created);
        }
        return current;
    });
    if (auto queued = queue.enqueue("DELETE_CARD", {{"id", "c2"}}); queued.is_error()) {
        spdlog::error("Card deletion lost: {}", describe(queued.error()));
        return 1;
    }

    spdlog::info("Queued operations: {}", queue.size().value_or(0));

    monitor.set_online(true);
    {
        std::unique_lock lock(done_mutex);
        done.wait_for(lock, std::chrono::seconds(10), [&]() { return drained; });
    }
    scheduler.stop();

    auto last = queue.last_sync_time();
    if (last.is_ok() && last.value()) {
        spdlog::info("Last sync at {} ms", to_millis(*last.value()));
    }

    auto stats = cache.stats();
    spdlog::info("Cache: {} items, {} valid, ~{} bytes",
                 stats.total_items, stats.valid_items, stats.approximate_size_bytes);

    auto swept = tracker.clear_expired_records();
    spdlog::info("Swept {} stale attempt records", swept.value);
    metrics.log_stats();
    return 0;
}
