/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus between the executor and the CLI.
 */

#ifndef METASCRUB_EVENT_BUS_HPP
#define METASCRUB_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace metascrub {

    /**
     * @brief Type-keyed publish/subscribe bus.
     *
     * @details ProcessorExecutor publishes per-file events from worker
     * threads; the CLI subscribes to drive its progress bar and report.
     * Handlers run on the publishing thread with the bus mutex held, so
     * handlers of one bus never run concurrently and must not publish.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to one event type.
         * @tparam Event The event struct type (e.g., FileProcessCompleteEvent).
         * @param handler Any callable accepting `const Event&`.
         */
        template <typename Event, typename Handler>
        void subscribe(Handler&& handler) {
            Callback erased = [fn = std::forward<Handler>(handler)](const void* e) mutable {
                fn(*static_cast<const Event*>(e));
            };
            std::lock_guard lock(mtx_);
            handlers_[key<Event>()].push_back(std::move(erased));
        }

        /**
         * @brief Deliver an event to every subscriber of its type.
         * @return Number of handlers that received it.
         */
        template <typename Event>
        std::size_t publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = handlers_.find(key<Event>());
            if (it == handlers_.end()) return 0;
            for (auto& handler : it->second) {
                handler(&event);
            }
            return it->second.size();
        }

        /// @return Number of handlers subscribed to Event.
        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() {
            std::lock_guard lock(mtx_);
            const auto it = handlers_.find(key<Event>());
            return it == handlers_.end() ? 0 : it->second.size();
        }

    private:
        using Callback = std::function<void(const void*)>;

        template <typename Event>
        static std::type_index key() { return std::type_index(typeid(Event)); }

        std::unordered_map<std::type_index, std::vector<Callback>> handlers_;
        std::mutex mtx_;
    };

} // namespace metascrub

#endif // METASCRUB_EVENT_BUS_HPP
