/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe hub for job lifecycle notifications
 *
 * The job engine emits events without knowing who listens; logging and
 * metrics subscribe without knowing who emits.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<JobFinishedEvent>([](const JobFinishedEvent& e) { ... });
 * bus.emit(JobFinishedEvent{...});
 */

#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace fetchd::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Workers emit concurrently with HTTP threads subscribing or emitting
 * - Handlers run synchronously on the emitting thread, outside the lock
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @return Subscription id for unsubscribe()
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back({handler_id, wrapper});
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& handler_list = it->second;
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& pair) {
                    return pair.first == handler_id;
                }),
            handler_list.end()
        );
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * A throwing handler is logged; the remaining handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace fetchd::events
