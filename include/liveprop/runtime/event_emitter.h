#ifndef LIVEPROP_EVENT_EMITTER_H
#define LIVEPROP_EVENT_EMITTER_H

#include <liveprop/liveprop_export.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace liveprop {
    /**
     * Per-object publish / subscribe table keyed by event name.
     *
     * Key characteristics:
     * - Handlers are called synchronously, on the firing thread, in registration order
     * - Delivery works on a snapshot: a handler added while an event is firing is not called for that firing,
     *   a handler removed while it is firing is still called for that firing
     * - Subscribing the same callable twice results in two calls
     * - Firing an event nobody listens to is a no-op
     */
    class LIVEPROP_EXPORT EventEmitter {
    public:
        using handler_t = std::function<void()>;
        using subscription_id = std::uint64_t;

        static constexpr subscription_id INVALID_SUBSCRIPTION = 0;

        EventEmitter() = default;

        EventEmitter(const EventEmitter &) = delete;

        EventEmitter &operator=(const EventEmitter &) = delete;

        /**
         * Register handler for event.
         * @return the id to pass to unsubscribe, or INVALID_SUBSCRIPTION if the handler is empty
         */
        subscription_id subscribe(const std::string &event, handler_t handler);

        /**
         * @return true if the subscription existed
         */
        bool unsubscribe(subscription_id id);

        /**
         * Remove every handler registered for event.
         * @return the number of handlers removed
         */
        std::size_t unsubscribe_all(const std::string &event);

        void fire(const std::string &event);

        [[nodiscard]] std::size_t subscriber_count(const std::string &event) const;

        [[nodiscard]] bool has_subscribers(const std::string &event) const { return subscriber_count(event) > 0; }

    private:
        struct Subscription {
            subscription_id id;
            // Shared so a handler that unsubscribes itself stays alive until its call returns
            std::shared_ptr<handler_t> handler;
        };

        std::unordered_map<std::string, std::vector<Subscription>> _subscriptions{};
        std::unordered_map<subscription_id, std::string> _event_by_id{};
        subscription_id _next_id{INVALID_SUBSCRIPTION + 1};
    };
}

#endif  // LIVEPROP_EVENT_EMITTER_H
