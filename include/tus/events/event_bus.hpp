/**
 * @file event_bus.hpp
 * @brief Type-safe event bus connecting uploads to their observers
 *
 * WHY THIS FILE EXISTS:
 * The transfer loop announces every descriptor change (created, chunk
 * accepted, offset reconciled) without knowing who persists it, logs it
 * or counts it. Observers subscribe without touching the upload code.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ChunkAcceptedEvent>([&](const ChunkAcceptedEvent& e) {
 *     store.save(e.descriptor);
 * });
 *
 * Observers that may die before the bus keep a Subscription instead:
 * auto sub = bus.subscribe_scoped<UploadFailedEvent>(on_failed);
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace tus::events {

class EventBus;

/**
 * @brief Move-only handle that unsubscribes when destroyed
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBus* bus, std::type_index type, std::size_t id)
        : bus_(bus), type_(type), id_(id) {}

    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : bus_(other.bus_), type_(other.type_), id_(other.id_) {
        other.bus_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = other.bus_;
            type_ = other.type_;
            id_ = other.id_;
            other.bus_ = nullptr;
        }
        return *this;
    }

    /// Unsubscribe now (no-op when already released)
    inline void reset();

    [[nodiscard]] bool active() const noexcept { return bus_ != nullptr; }

private:
    EventBus* bus_ = nullptr;
    std::type_index type_{typeid(void)};
    std::size_t id_ = 0;
};

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Several uploads may emit on the same bus concurrently
 * - Handlers run synchronously on the emitting (upload) thread, so a
 *   persistence handler has finished before the next chunk is sent
 * - A handler may subscribe or unsubscribe while it runs
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     * @return Subscription ID for unsubscribe()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        auto slot = std::make_shared<Slot>();
        slot->invoke = [fn = std::move(handler)](const void* event) {
            // Only EventType* is ever stored under EventType's type_index
            fn(*static_cast<const EventType*>(event));
        };

        std::unique_lock lock(mutex_);
        slot->id = next_id_++;
        slots_[std::type_index(typeid(EventType))].push_back(slot);
        return slot->id;
    }

    /// Subscribe for the lifetime of the returned handle
    template<typename EventType>
    [[nodiscard]] Subscription subscribe_scoped(std::function<void(const EventType&)> handler) {
        const auto id = subscribe<EventType>(std::move(handler));
        return Subscription(this, std::type_index(typeid(EventType)), id);
    }

    template<typename EventType>
    void unsubscribe(std::size_t id) {
        remove(std::type_index(typeid(EventType)), id);
    }

    void remove(std::type_index type, std::size_t id) {
        std::unique_lock lock(mutex_);
        auto it = slots_.find(type);
        if (it == slots_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const auto& slot) { return slot->id == id; }),
                   list.end());
    }

    /**
     * @brief Deliver @p event to every subscriber of its type
     *
     * A handler that throws a std::exception is logged and skipped; the
     * remaining handlers still run and the emitting upload continues.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        // Snapshot so handlers can (un)subscribe while running
        std::vector<std::shared_ptr<const Slot>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = slots_.find(std::type_index(typeid(EventType)));
            if (it == slots_.end()) {
                return;
            }
            snapshot.assign(it->second.begin(), it->second.end());
        }

        for (const auto& slot : snapshot) {
            try {
                slot->invoke(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler #{} for {} threw: {}", slot->id, typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    [[nodiscard]] std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(std::type_index(typeid(EventType)));
        return it != slots_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    struct Slot {
        std::size_t id = 0;
        std::function<void(const void*)> invoke;
    };

    std::unordered_map<std::type_index, std::vector<std::shared_ptr<const Slot>>> slots_;
    mutable std::shared_mutex mutex_;
    std::size_t next_id_ = 0;
};

inline void Subscription::reset() {
    if (bus_ != nullptr) {
        bus_->remove(type_, id_);
        bus_ = nullptr;
    }
}

} // namespace tus::events
