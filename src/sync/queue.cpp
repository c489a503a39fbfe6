#include "holdfast/sync/queue.hpp"

#include "holdfast/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>

namespace holdfast::sync {
namespace {

using Operations = std::vector<SyncOperation>;

std::string to_base36(std::uint64_t value) {
    static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.push_back(kDigits[value % 36]);
        value /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

bool well_formed(const SyncOperation& operation) {
    return !operation.id.empty() && operation.attempts >= 0 && operation.max_attempts > 0
        && operation.payload.is_object();
}

} // namespace

SyncQueue::SyncQueue(store::DurableStore& store,
                     const Clock& clock,
                     events::EventBus& bus,
                     const Config& config)
    : store_(store),
      clock_(clock),
      bus_(bus),
      keys_(config.key_prefix),
      max_attempts_(config.sync.max_attempts),
      rng_(std::random_device{}()) {}

Result<SyncOperation, Error> SyncQueue::enqueue(const std::string& kind, nlohmann::json payload) {
    if (kind.empty()) {
        return Err<SyncOperation>(Error::invalid("operation kind must not be empty"));
    }
    if (!payload.is_object()) {
        return Err<SyncOperation>(Error::invalid("operation payload must be a JSON object"));
    }

    SyncOperation operation;
    std::size_t queue_length = 0;
    {
        PublishFaultsOnExit publish{*this};
        std::lock_guard lock(mutex_);

        auto loaded = load_locked();
        if (loaded.is_error()) {
            report_fault_locked("enqueue", loaded.error());
            return Err<SyncOperation>(loaded.error());
        }

        operation.id = generate_id();
        operation.kind = kind;
        operation.payload = std::move(payload);
        operation.enqueued_at = clock_.now();
        operation.attempts = 0;
        operation.max_attempts = max_attempts_;

        auto& operations = loaded.value();
        operations.push_back(operation);

        if (auto stored = store_locked(operations); stored.is_error()) {
            report_fault_locked("enqueue", stored.error());
            return Err<SyncOperation>(stored.error());
        }
        queue_length = operations.size();
    }

    bus_.emit(events::OperationEnqueuedEvent{operation.id, operation.kind, queue_length});
    return Ok<SyncOperation, Error>(std::move(operation));
}

Result<std::vector<SyncOperation>, Error> SyncQueue::snapshot() {
    PublishFaultsOnExit publish{*this};
    std::lock_guard lock(mutex_);

    auto loaded = load_locked();
    if (loaded.is_error()) {
        report_fault_locked("snapshot", loaded.error());
    }
    return loaded;
}

Result<std::size_t, Error> SyncQueue::size() {
    auto operations = snapshot();
    if (operations.is_error()) {
        return Err<std::size_t>(operations.error());
    }
    return Ok<std::size_t, Error>(operations.value().size());
}

Result<void, Error> SyncQueue::remove(const std::string& id) {
    PublishFaultsOnExit publish{*this};
    std::lock_guard lock(mutex_);

    auto loaded = load_locked();
    if (loaded.is_error()) {
        report_fault_locked("remove", loaded.error());
        return Err<void>(loaded.error());
    }

    auto& operations = loaded.value();
    const auto it = std::find_if(operations.begin(), operations.end(),
                                 [&id](const SyncOperation& op) { return op.id == id; });
    if (it == operations.end()) {
        return Ok();
    }
    operations.erase(it);

    auto stored = store_locked(operations);
    if (stored.is_error()) {
        report_fault_locked("remove", stored.error());
    }
    return stored;
}

Result<OperationFate, Error> SyncQueue::record_failure(const std::string& id, const Error& error) {
    SyncOperation failed;
    OperationFate fate = OperationFate::Retry;
    {
        PublishFaultsOnExit publish{*this};
        std::lock_guard lock(mutex_);

        auto loaded = load_locked();
        if (loaded.is_error()) {
            report_fault_locked("record_failure", loaded.error());
            return Err<OperationFate>(loaded.error());
        }

        auto& operations = loaded.value();
        const auto it = std::find_if(operations.begin(), operations.end(),
                                     [&id](const SyncOperation& op) { return op.id == id; });
        if (it == operations.end()) {
            return Ok<OperationFate, Error>(OperationFate::Gone);
        }

        it->attempts += 1;
        it->last_error = error.message;
        failed = *it;

        if (it->attempts >= it->max_attempts) {
            operations.erase(it);
            fate = OperationFate::Dropped;
        }

        if (auto stored = store_locked(operations); stored.is_error()) {
            report_fault_locked("record_failure", stored.error());
            return Err<OperationFate>(stored.error());
        }
    }

    if (fate == OperationFate::Dropped) {
        const Error exhausted{ErrorKind::RetryExhausted,
                              "gave up after " + std::to_string(failed.attempts) + " attempts: " + error.message};
        spdlog::error("Dropping sync operation {} ({}): {}", failed.id, failed.kind, describe(exhausted));
        bus_.emit(events::OperationDroppedEvent{failed.id, failed.kind, failed.attempts, exhausted});
    } else {
        bus_.emit(events::OperationRetryScheduledEvent{
            failed.id, failed.kind, failed.attempts, failed.max_attempts, error});
    }
    return Ok<OperationFate, Error>(fate);
}

Result<void, Error> SyncQueue::clear() {
    PublishFaultsOnExit publish{*this};
    std::lock_guard lock(mutex_);

    auto removed = store_.remove(keys_.sync_queue());
    if (removed.is_error()) {
        report_fault_locked("clear", removed.error());
        return removed;
    }
    spdlog::info("Sync queue cleared");
    return Ok();
}

Result<void, Error> SyncQueue::mark_synced(TimePoint when) {
    auto stored = store_.set(keys_.last_sync(), std::to_string(to_millis(when)));
    if (stored.is_error()) {
        report_fault("mark_synced", stored.error());
    }
    return stored;
}

Result<std::optional<TimePoint>, Error> SyncQueue::last_sync_time() {
    using Loaded = std::optional<TimePoint>;

    auto raw = store_.get(keys_.last_sync());
    if (raw.is_error()) {
        report_fault("last_sync_time", raw.error());
        return Err<Loaded>(raw.error());
    }
    if (!raw.value()) {
        return Ok<Loaded, Error>(std::nullopt);
    }

    const auto& text = *raw.value();
    std::int64_t millis = 0;
    try {
        std::size_t consumed = 0;
        millis = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return Err<Loaded>(Error::corrupt("last sync time is not a number: " + text));
        }
    } catch (const std::exception&) {
        return Err<Loaded>(Error::corrupt("last sync time is not a number: " + text));
    }
    if (!persisted_millis_in_range(millis)) {
        return Err<Loaded>(Error::corrupt("last sync time out of range: " + text));
    }
    return Ok<Loaded, Error>(from_millis(millis));
}

Result<std::vector<SyncOperation>, Error> SyncQueue::load_locked() {
    auto raw = store_.get(keys_.sync_queue());
    if (raw.is_error()) {
        return Err<Operations>(raw.error());
    }
    if (!raw.value()) {
        return Ok<Operations, Error>(Operations{});
    }

    const auto& text = *raw.value();
    const auto document = nlohmann::json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_array()) {
        return quarantine_locked(text, "queue is not a JSON array");
    }

    Operations operations;
    operations.reserve(document.size());
    try {
        for (const auto& element : document) {
            auto operation = element.get<SyncOperation>();
            if (!well_formed(operation)) {
                return quarantine_locked(text, "operation " + operation.id + " has invalid fields");
            }
            operations.push_back(std::move(operation));
        }
    } catch (const std::exception& e) {
        // nlohmann::json::exception or std::out_of_range from from_json
        return quarantine_locked(text, e.what());
    }
    return Ok<Operations, Error>(std::move(operations));
}

Result<void, Error> SyncQueue::store_locked(const std::vector<SyncOperation>& operations) {
    std::string text;
    try {
        text = nlohmann::json(operations).dump();
    } catch (const nlohmann::json::exception& e) {
        return Err<void>(Error::invalid(std::string("sync queue: ") + e.what()));
    }
    return store_.set(keys_.sync_queue(), std::move(text));
}

Result<std::vector<SyncOperation>, Error> SyncQueue::quarantine_locked(const std::string& raw,
                                                                       const std::string& reason) {
    const auto quarantine_key = keys_.quarantine(to_millis(clock_.now()), to_base36(rng_()));

    // Keep the damaged payload before replacing it
    if (auto kept = store_.set(quarantine_key, raw); kept.is_error()) {
        return Err<Operations>(kept.error());
    }
    if (auto removed = store_.remove(keys_.sync_queue()); removed.is_error()) {
        return Err<Operations>(removed.error());
    }

    spdlog::error("Sync queue was unreadable ({}); moved to {} and started a new queue", reason, quarantine_key);
    pending_faults_.push_back(PendingFault{"load", Error::corrupt(reason)});
    return Ok<Operations, Error>(Operations{});
}

std::string SyncQueue::generate_id() {
    const auto millis = static_cast<std::uint64_t>(to_millis(clock_.now()));
    return to_base36(millis) + "-" + to_base36(rng_());
}

void SyncQueue::report_fault(const char* operation, const Error& error) {
    spdlog::error("SyncQueue::{} failed: {}", operation, describe(error));
    bus_.emit(events::StorageFaultEvent{"sync_queue", operation, error});
}

void SyncQueue::report_fault_locked(const char* operation, const Error& error) {
    spdlog::error("SyncQueue::{} failed: {}", operation, describe(error));
    pending_faults_.push_back(PendingFault{operation, error});
}

void SyncQueue::publish_faults() {
    std::vector<PendingFault> faults;
    {
        std::lock_guard lock(mutex_);
        faults.swap(pending_faults_);
    }
    for (const auto& fault : faults) {
        bus_.emit(events::StorageFaultEvent{"sync_queue", fault.operation, fault.error});
    }
}

} // namespace holdfast::sync
