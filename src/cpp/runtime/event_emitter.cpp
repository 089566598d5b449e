#include <liveprop/runtime/event_emitter.h>

#include <algorithm>

namespace liveprop {
    EventEmitter::subscription_id EventEmitter::subscribe(const std::string &event, handler_t handler) {
        if (!handler) { return INVALID_SUBSCRIPTION; }
        auto id{_next_id++};
        _subscriptions[event].push_back(Subscription{id, std::make_shared<handler_t>(std::move(handler))});
        _event_by_id.emplace(id, event);
        return id;
    }

    bool EventEmitter::unsubscribe(subscription_id id) {
        auto it{_event_by_id.find(id)};
        if (it == _event_by_id.end()) { return false; }
        auto subscriptions{_subscriptions.find(it->second)};
        if (subscriptions != _subscriptions.end()) {
            auto &handlers{subscriptions->second};
            std::erase_if(handlers, [id](const Subscription &s) { return s.id == id; });
            if (handlers.empty()) { _subscriptions.erase(subscriptions); }
        }
        _event_by_id.erase(it);
        return true;
    }

    std::size_t EventEmitter::unsubscribe_all(const std::string &event) {
        auto it{_subscriptions.find(event)};
        if (it == _subscriptions.end()) { return 0; }
        auto count{it->second.size()};
        for (const auto &subscription : it->second) { _event_by_id.erase(subscription.id); }
        _subscriptions.erase(it);
        return count;
    }

    void EventEmitter::fire(const std::string &event) {
        auto it{_subscriptions.find(event)};
        if (it == _subscriptions.end()) { return; }
        // Handlers may subscribe or unsubscribe while we iterate, so work from a copy
        std::vector<Subscription> snapshot{it->second};
        for (const auto &subscription : snapshot) { (*subscription.handler)(); }
    }

    std::size_t EventEmitter::subscriber_count(const std::string &event) const {
        auto it{_subscriptions.find(event)};
        return it == _subscriptions.end() ? 0 : it->second.size();
    }
}
