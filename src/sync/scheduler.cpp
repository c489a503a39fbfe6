#include "holdfast/sync/scheduler.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace holdfast::sync {

SyncScheduler::SyncScheduler(SyncCoordinator& coordinator,
                             net::ConnectivityMonitor& monitor,
                             ApplyFn apply,
                             ReportFn on_report)
    : coordinator_(coordinator),
      monitor_(monitor),
      apply_(std::move(apply)),
      on_report_(std::move(on_report)) {}

SyncScheduler::~SyncScheduler() {
    stop();
}

void SyncScheduler::start() {
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (running_) {
        return;
    }

    ThreadSafeQueue<DrainRequest>* requests = nullptr;
    {
        std::lock_guard lock(request_mutex_);
        requests_ = std::make_unique<ThreadSafeQueue<DrainRequest>>();
        requests = requests_.get();
        pending_ = false;
        running_ = true;
    }

    try {
        worker_ = std::thread(&SyncScheduler::worker_loop, this, requests);
    } catch (const std::system_error& e) {
        spdlog::error("[SyncScheduler] Failed to start worker: {}", e.what());
        std::lock_guard lock(request_mutex_);
        running_ = false;
        requests_->close();
        return;
    }

    last_online_ = monitor_.current_status();
    subscription_ = monitor_.subscribe([this](bool online) { on_status(online); });
    spdlog::info("[SyncScheduler] Started");

    if (last_online_) {
        enqueue_request("startup");
    }
}

void SyncScheduler::stop() {
    std::lock_guard lifecycle(lifecycle_mutex_);

    subscription_.unsubscribe();
    {
        std::lock_guard lock(request_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        requests_->close();
    }

    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("[SyncScheduler] Stopped after {} drains", drains_run_.load());
}

bool SyncScheduler::request_drain() {
    return enqueue_request("requested");
}

bool SyncScheduler::enqueue_request(const char* reason) {
    std::lock_guard lock(request_mutex_);
    if (!running_) {
        return false;
    }
    if (pending_.exchange(true)) {
        return true;  // Merged into the waiting request
    }
    if (!requests_->push(DrainRequest{reason})) {
        pending_ = false;
        return false;
    }
    return true;
}

void SyncScheduler::worker_loop(ThreadSafeQueue<DrainRequest>* requests) {
    while (auto request = requests->pop()) {
        if (!running_) {
            break;
        }
        pending_ = false;
        spdlog::debug("[SyncScheduler] Drain triggered: {}", request->reason);

        const auto report = coordinator_.drain(apply_);
        drains_run_++;

        if (on_report_) {
            try {
                on_report_(report);
            } catch (const std::exception& e) {
                spdlog::error("[SyncScheduler] Report callback threw: {}", e.what());
            }
        }
    }
}

void SyncScheduler::on_status(bool online) {
    const bool was_online = last_online_.exchange(online);
    if (online && !was_online) {
        spdlog::info("[SyncScheduler] Back online, scheduling drain");
        enqueue_request("reconnected");
    }
}

} // namespace holdfast::sync
