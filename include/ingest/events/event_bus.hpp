/**
 * @file event_bus.hpp
 * @brief Type-safe event bus connecting the executor to its observers
 *
 * The executor emits one event per plan entry; the logger, the run tally
 * and the console report subscribe without the executor knowing about them.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<FileSkippedEvent>([](const FileSkippedEvent& e) { ... });
 * bus.emit(FileSkippedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ingest::events {

/**
 * @brief Type-safe publish/subscribe hub
 *
 * Handlers run synchronously, in subscription order, on the emitting thread.
 * A run is single-threaded, so the bus carries no locking.
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    // Non-copyable (would duplicate handlers)
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    EventBus(EventBus&&) = default;
    EventBus& operator=(EventBus&&) = default;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS:
     * Subscription ID for unsubscribe()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        const auto type_id = std::type_index(typeid(EventType));
        const std::size_t handler_id = next_handler_id_++;
        handlers_[type_id].emplace_back(handler_id,
                                        std::make_shared<HandlerImpl<EventType>>(std::move(handler)));
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        for (auto entry = list.begin(); entry != list.end(); ++entry) {
            if (entry->first == handler_id) {
                list.erase(entry);
                return;
            }
        }
    }

    /**
     * @brief Deliver `event` to every subscriber of its type
     *
     * A throwing handler is logged and does not stop the others.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }

        // Copy so a handler may subscribe/unsubscribe while we iterate
        auto handlers_copy = it->second;
        for (auto& [id, handler] : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler {} threw: {}", id, e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() { handlers_.clear(); }

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
        std::vector<std::pair<std::size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    std::size_t next_handler_id_ = 0;
};

} // namespace ingest::events
