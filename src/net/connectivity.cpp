#include "holdfast/net/connectivity.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace holdfast::net {

ConnectivityMonitor::ConnectivityMonitor() : registry_(std::make_shared<Registry>()) {}

Subscription ConnectivityMonitor::subscribe(StatusCallback callback) {
    auto slot = std::make_shared<Slot>(std::move(callback));
    std::size_t id = 0;
    {
        std::lock_guard lock(registry_->mutex);
        id = registry_->next_id++;
        registry_->slots.emplace(id, slot);
    }

    std::weak_ptr<Registry> weak = registry_;
    return Subscription([weak, id, slot]() {
        if (auto registry = weak.lock()) {
            std::lock_guard lock(registry->mutex);
            registry->slots.erase(id);
        }
        // Waits for a notify() already inside the callback
        std::lock_guard call(slot->call_mutex);
        slot->alive = false;
    });
}

std::size_t ConnectivityMonitor::subscriber_count() const {
    std::lock_guard lock(registry_->mutex);
    return registry_->slots.size();
}

void ConnectivityMonitor::notify(bool online) {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard lock(registry_->mutex);
        slots.reserve(registry_->slots.size());
        for (const auto& [id, slot] : registry_->slots) {
            slots.push_back(slot);
        }
    }

    for (const auto& slot : slots) {
        std::lock_guard call(slot->call_mutex);
        if (!slot->alive) {
            continue;  // Unsubscribed after the snapshot
        }
        try {
            slot->callback(online);
        } catch (const std::exception& e) {
            spdlog::error("[Connectivity] Status callback threw: {}", e.what());
        }
    }
}

// ════════════════════════════════════════════════════════
// ManualConnectivityMonitor
// ════════════════════════════════════════════════════════

void ManualConnectivityMonitor::set_online(bool online) {
    // Serializes transitions so subscribers see them in order
    std::lock_guard lock(transition_mutex_);
    if (online_.exchange(online) == online) {
        return;
    }
    spdlog::info("[Connectivity] Status changed: {}", online ? "online" : "offline");
    notify(online);
}

// ════════════════════════════════════════════════════════
// PollingConnectivityMonitor
// ════════════════════════════════════════════════════════

PollingConnectivityMonitor::PollingConnectivityMonitor(ReachabilityCheck check, std::chrono::milliseconds interval)
    : check_(std::move(check)), interval_(interval) {}

PollingConnectivityMonitor::~PollingConnectivityMonitor() {
    stop();
}

void PollingConnectivityMonitor::start() {
    if (running_.exchange(true)) {
        return;
    }

    try {
        monitor_thread_ = std::thread(&PollingConnectivityMonitor::monitor_loop, this);
        spdlog::info("[Connectivity] Polling every {}ms", interval_.count());
    } catch (const std::system_error& e) {
        spdlog::error("[Connectivity] Failed to start polling thread: {}", e.what());
        running_ = false;
    }
}

void PollingConnectivityMonitor::stop() {
    {
        std::lock_guard lock(wake_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_.notify_all();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
    spdlog::info("[Connectivity] Polling stopped");
}

bool PollingConnectivityMonitor::run_check() {
    try {
        return check_();
    } catch (const std::exception& e) {
        spdlog::warn("[Connectivity] Reachability check threw, treating as offline: {}", e.what());
        return false;
    }
}

void PollingConnectivityMonitor::monitor_loop() {
    while (running_) {
        const bool now_online = run_check();
        const bool was_online = online_.exchange(now_online);

        if (now_online != was_online) {
            if (now_online) {
                spdlog::info("[Connectivity] Connection restored");
            } else {
                spdlog::warn("[Connectivity] Connection lost");
            }
            notify(now_online);
        }

        std::unique_lock lock(wake_mutex_);
        wake_.wait_for(lock, interval_, [this]() { return !running_.load(); });
    }
}

} // namespace holdfast::net
