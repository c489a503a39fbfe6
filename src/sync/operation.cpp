#include "holdfast/sync/types.hpp"

#include <stdexcept>
#include <string>

namespace holdfast::sync {

void to_json(nlohmann::json& j, const SyncOperation& operation) {
    j = nlohmann::json{
        {"id", operation.id},
        {"kind", operation.kind},
        {"payload", operation.payload},
        {"enqueuedAt", to_millis(operation.enqueued_at)},
        {"attempts", operation.attempts},
        {"maxAttempts", operation.max_attempts},
    };
    if (operation.last_error) {
        j["lastError"] = *operation.last_error;
    }
}

// Throws nlohmann::json::exception on missing or mistyped fields and
// std::out_of_range on an unrepresentable timestamp; the queue treats
// either, and out-of-range counters, as a corrupt payload.
void from_json(const nlohmann::json& j, SyncOperation& operation) {
    j.at("id").get_to(operation.id);
    j.at("kind").get_to(operation.kind);
    operation.payload = j.value("payload", nlohmann::json::object());

    const auto enqueued_millis = j.at("enqueuedAt").get<std::int64_t>();
    if (!persisted_millis_in_range(enqueued_millis)) {
        throw std::out_of_range("enqueuedAt " + std::to_string(enqueued_millis) + " out of range");
    }
    operation.enqueued_at = from_millis(enqueued_millis);
    j.at("attempts").get_to(operation.attempts);
    j.at("maxAttempts").get_to(operation.max_attempts);

    const auto error = j.find("lastError");
    if (error != j.end() && error->is_string()) {
        operation.last_error = error->get<std::string>();
    } else {
        operation.last_error.reset();
    }
}

const char* to_string(DrainStatus status) noexcept {
    switch (status) {
        case DrainStatus::Completed: return "completed";
        case DrainStatus::Offline: return "offline";
        case DrainStatus::AlreadyRunning: return "already-running";
        case DrainStatus::StorageFault: return "storage-fault";
    }
    return "unknown";
}

} // namespace holdfast::sync
