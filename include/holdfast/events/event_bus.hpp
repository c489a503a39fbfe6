/**
 * @file event_bus.hpp
 * @brief In-process bus for holdfast domain events
 *
 * WHY THIS FILE EXISTS:
 * The tracker, cache and sync queue report what they did (attempt denied,
 * entry expired, operation dropped) without knowing who listens. Logging
 * and metrics subscribe here instead of being wired into every component.
 *
 * DELIVERY:
 * Handlers run synchronously on the emitting thread, in subscription order.
 * emit() snapshots the handler list first, so a handler may subscribe or
 * unsubscribe without deadlocking. A handler that throws is logged and the
 * remaining handlers still run.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<OperationDroppedEvent>([](const OperationDroppedEvent& e) {
 *     spdlog::warn("Dropped {}", e.id);
 * });
 * bus.emit(OperationDroppedEvent{...});
 * bus.unsubscribe<OperationDroppedEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace holdfast::events {

class EventBus {
public:
    using HandlerId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for one event type
     * @return Id to pass to unsubscribe()
     */
    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<const ErasedHandler>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const HandlerId id = ++last_id_;
        slots_[std::type_index(typeid(EventType))].push_back(Slot{id, std::move(erased)});
        return id;
    }

    /// @return false if no handler with this id was registered for EventType
    template<typename EventType>
    bool unsubscribe(HandlerId id) {
        std::unique_lock lock(mutex_);
        auto it = slots_.find(std::type_index(typeid(EventType)));
        if (it == slots_.end()) {
            return false;
        }

        auto& slots = it->second;
        for (auto slot = slots.begin(); slot != slots.end(); ++slot) {
            if (slot->id == id) {
                slots.erase(slot);
                if (slots.empty()) {
                    slots_.erase(it);
                }
                return true;
            }
        }
        return false;
    }

    template<typename EventType>
    void emit(const EventType& event) const {
        const auto handlers = snapshot(std::type_index(typeid(EventType)));

        for (const auto& handler : handlers) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] Handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(std::type_index(typeid(EventType)));
        return it == slots_.end() ? 0 : it->second.size();
    }

    /// Drop every handler of every type
    void clear() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    using ErasedHandler = std::function<void(const void*)>;

    struct Slot {
        HandlerId id;
        std::shared_ptr<const ErasedHandler> handler;
    };

    std::vector<std::shared_ptr<const ErasedHandler>> snapshot(std::type_index type) const {
        std::vector<std::shared_ptr<const ErasedHandler>> handlers;
        std::shared_lock lock(mutex_);
        auto it = slots_.find(type);
        if (it != slots_.end()) {
            handlers.reserve(it->second.size());
            for (const auto& slot : it->second) {
                handlers.push_back(slot.handler);
            }
        }
        return handlers;
    }

    std::unordered_map<std::type_index, std::vector<Slot>> slots_;
    mutable std::shared_mutex mutex_;
    HandlerId last_id_ = 0;
};

} // namespace holdfast::events
