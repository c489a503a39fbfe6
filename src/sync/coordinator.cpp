#include "holdfast/sync/coordinator.hpp"

#include "holdfast/events/events.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <memory>
#include <system_error>
#include <thread>

namespace holdfast::sync {
namespace {

using ApplyResult = Result<void, std::string>;

Error apply_failure(std::string message) {
    return Error{ErrorKind::ApplyFailure, std::move(message)};
}

Result<void, Error> to_apply_result(std::future<ApplyResult>& pending) {
    try {
        auto result = pending.get();
        if (result.is_error()) {
            return Err<void>(apply_failure(result.error()));
        }
        return Ok();
    } catch (const std::exception& e) {
        return Err<void>(apply_failure(e.what()));
    } catch (...) {
        return Err<void>(apply_failure("apply threw a non-standard exception"));
    }
}

} // namespace

// Holds the in-flight flag. drain() keeps one reference and every apply
// thread another; the flag clears when the last of them lets go.
class SyncCoordinator::InFlight {
public:
    explicit InFlight(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}
    ~InFlight() { flag_->store(false); }

    InFlight(const InFlight&) = delete;
    InFlight& operator=(const InFlight&) = delete;

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

SyncCoordinator::SyncCoordinator(SyncQueue& queue,
                                 net::ConnectivityMonitor& monitor,
                                 const Clock& clock,
                                 events::EventBus& bus,
                                 const Config& config)
    : queue_(queue),
      monitor_(monitor),
      clock_(clock),
      bus_(bus),
      apply_timeout_(config.sync.apply_timeout) {}

DrainReport SyncCoordinator::drain(const ApplyFn& apply) {
    return drain(apply, [this]() { return monitor_.current_status(); });
}

DrainReport SyncCoordinator::drain(const ApplyFn& apply, const OnlineFn& is_online) {
    DrainReport report;
    report.started_at = clock_.now();

    if (draining_->exchange(true)) {
        spdlog::debug("Drain requested while another drain is running");
        report.status = DrainStatus::AlreadyRunning;
        report.finished_at = report.started_at;
        return report;
    }
    auto in_flight = std::make_shared<InFlight>(draining_);

    auto finish = [&](DrainStatus status) {
        report.status = status;
        report.finished_at = clock_.now();
        bus_.emit(events::DrainCompletedEvent{report});
        return report;
    };

    if (!is_online()) {
        spdlog::info("Offline, sync queue not drained");
        return finish(DrainStatus::Offline);
    }

    auto snapshot = queue_.snapshot();
    if (snapshot.is_error()) {
        report.storage_faults += 1;
        return finish(DrainStatus::StorageFault);
    }

    const auto& operations = snapshot.value();
    if (operations.empty()) {
        spdlog::debug("Sync queue is empty");
    } else {
        spdlog::info("Draining {} queued operations", operations.size());
    }

    for (std::size_t i = 0; i < operations.size(); ++i) {
        const auto& operation = operations[i];
        bool abandoned = false;
        auto applied = apply_one(apply, operation, in_flight, abandoned);

        if (applied.is_ok()) {
            report.applied += 1;
            if (queue_.remove(operation.id).is_error()) {
                // Stays queued and will be applied again on the next drain
                report.storage_faults += 1;
            }
            bus_.emit(events::OperationAppliedEvent{operation.id, operation.kind, operation.attempts});
            continue;
        }

        auto fate = queue_.record_failure(operation.id, applied.error());
        if (fate.is_error()) {
            report.storage_faults += 1;
        } else {
            switch (fate.value()) {
                case OperationFate::Retry: report.retried += 1; break;
                case OperationFate::Dropped: report.dropped += 1; break;
                case OperationFate::Gone: break;
            }
        }

        if (abandoned) {
            // The abandoned call still holds the in-flight flag; nothing else
            // is applied until it returns
            report.deferred = operations.size() - i - 1;
            if (report.deferred > 0) {
                spdlog::warn("Timed-out apply still running, {} operations left for a later drain",
                             report.deferred);
            }
            break;
        }
    }

    if (queue_.mark_synced(clock_.now()).is_error()) {
        report.storage_faults += 1;
    }
    return finish(DrainStatus::Completed);
}

Result<void, Error> SyncCoordinator::apply_one(const ApplyFn& apply,
                                               const SyncOperation& operation,
                                               const std::shared_ptr<InFlight>& in_flight,
                                               bool& abandoned) const {
    if (apply_timeout_.count() <= 0) {
        std::packaged_task<ApplyResult()> task([&apply, &operation]() { return apply(operation); });
        auto pending = task.get_future();
        task();
        return to_apply_result(pending);
    }

    // The worker owns copies of everything it touches; it may outlive this call
    auto task = std::make_shared<std::packaged_task<ApplyResult()>>(
        [apply, operation]() { return apply(operation); });
    auto pending = task->get_future();
    auto returned = std::make_shared<std::promise<void>>();
    auto returned_future = returned->get_future();

    try {
        std::thread([task, returned, hold = in_flight]() mutable {
            (*task)();
            hold.reset();
            returned->set_value();
        }).detach();
    } catch (const std::system_error& e) {
        return Err<void>(apply_failure(std::string("could not start apply thread: ") + e.what()));
    }

    if (returned_future.wait_for(apply_timeout_) != std::future_status::ready) {
        abandoned = true;
        spdlog::warn("Apply of {} ({}) exceeded {}ms, no further applies until it returns",
                     operation.id, operation.kind, apply_timeout_.count());
        return Err<void>(Error{ErrorKind::Timeout,
                               "apply did not finish within " + std::to_string(apply_timeout_.count()) + "ms"});
    }
    return to_apply_result(pending);
}

} // namespace holdfast::sync
