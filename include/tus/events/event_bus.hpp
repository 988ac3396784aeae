/**
 * @file event_bus.hpp
 * @brief In-process publish/subscribe keyed by event type
 *
 * The upload service publishes lifecycle events here and never learns who
 * consumes them. UploadFinishedEvent is the completion handoff: it is
 * published exactly once per finished upload, and anything that needs to
 * react (indexing, thumbnailing, bookkeeping) subscribes to it.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<UploadFinishedEvent>([](const UploadFinishedEvent& e) {
 *     spdlog::info("stored {}", e.final_path.string());
 * });
 * bus.emit(UploadFinishedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tus::events {

/**
 * @brief Thread-safe, type-indexed event bus
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/clear take the exclusive lock
 * - emit copies the subscriber list under a shared lock and then calls
 *   handlers without any lock held, on the emitting thread, so a handler
 *   may itself subscribe or emit
 */
class EventBus {
public:
    using SubscriptionId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register handler for EventType
     * @return id accepted by unsubscribe()
     */
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        auto slot = std::make_shared<Slot<EventType>>(std::move(handler));

        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        subscribers_[std::type_index(typeid(EventType))].emplace_back(id, std::move(slot));
        return id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto it = subscribers_.find(std::type_index(typeid(EventType)));
        if (it == subscribers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   list.end());
    }

    /**
     * @brief Deliver event to every current subscriber of its type
     *
     * A handler that throws std::exception is logged; delivery continues
     * with the next handler.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<SlotBase>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = subscribers_.find(std::type_index(typeid(EventType)));
            if (it == subscribers_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& entry : it->second) {
                targets.push_back(entry.second);
            }
        }

        for (const auto& target : targets) {
            try {
                target->invoke(&event);
            } catch (const std::exception& e) {
                spdlog::error("Subscriber of {} failed: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = subscribers_.find(std::type_index(typeid(EventType)));
        return it == subscribers_.end() ? 0 : it->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        subscribers_.clear();
    }

private:
    struct SlotBase {
        virtual ~SlotBase() = default;
        virtual void invoke(const void* event) const = 0;
    };

    template<typename EventType>
    struct Slot : SlotBase {
        explicit Slot(std::function<void(const EventType&)> fn) : handler(std::move(fn)) {}

        void invoke(const void* event) const override {
            handler(*static_cast<const EventType*>(event));
        }

        std::function<void(const EventType&)> handler;
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<SubscriptionId, std::shared_ptr<SlotBase>>>> subscribers_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace tus::events
