/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef KBFIT_EVENT_BUS_HPP
#define KBFIT_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace kbfit {

    /**
     * @brief Type-safe publish/subscribe event bus.
     *
     * @details Producers (FeasibilityOracle, Compressor) broadcast events
     * without knowing who listens. Consumers (the observer bridge, the
     * CLI, tests) subscribe per event type.
     *
     * Handlers are invoked on the publishing thread, outside the internal
     * lock, so a handler may itself subscribe or publish.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g. ProbeEvent).
         * @param handler Invoked with a const reference to each published event.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back(
                [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         * @tparam Event The event struct type.
         * @param event The event instance to publish.
         */
        template <typename Event>
        void publish(const Event& event) const {
            std::vector<Callback> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                targets = it->second;
            }
            for (const auto& fn : targets) {
                fn(&event);
            }
        }

        /**
         * @brief Drop every subscription.
         */
        void clear() {
            std::lock_guard lock(mtx_);
            subscribers_.clear();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        mutable std::mutex mtx_;
    };

} // namespace kbfit

#endif // KBFIT_EVENT_BUS_HPP
