/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef AUDIOMIRROR_EVENT_BUS_HPP
#define AUDIOMIRROR_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace audiomirror {

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details Producers (TransferScheduler, PruneEngine) broadcast events
     * without knowing who listens; the CLI subscribes to drive its progress
     * bar and report. Workers publish concurrently, so subscriptions and
     * publications are serialized by a mutex and handlers never run in
     * parallel with each other.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., TransferCompleteEvent).
         * @param handler Function invoked with each published event of this type.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         * @tparam Event The event struct type.
         * @param event The event instance to publish.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it != subscribers_.end()) {
                for (auto& fn : it->second) {
                    fn(&event);
                }
            }
        }

    private:
        ///< Type alias for the internal type-erased callback.
        using Callback = std::function<void(const void*)>;
        ///< Map of event type_index to a vector of callbacks.
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        ///< Protects subscriber map during read/write.
        std::mutex mtx_;
    };

} // namespace audiomirror

#endif // AUDIOMIRROR_EVENT_BUS_HPP
