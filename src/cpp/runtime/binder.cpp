#include <liveprop/runtime/binder.h>

namespace liveprop {
    namespace {
        // Copy the value of source.source_name to target.target_name when they differ.
        // Either object may be destroyed while the other is still firing, the update is then a no-op.
        EventEmitter::handler_t make_update(LiveObject &target, std::string target_name,
                                            const LiveObject &source, std::string source_name) {
            return [&target, target_alive = target.lifetime(), target_name = std::move(target_name),
                    &source, source_alive = source.lifetime(), source_name = std::move(source_name)]() {
                if (target_alive.expired() || source_alive.expired()) { return; }
                auto new_value{source.get(source_name)};
                if (target.get(target_name) != new_value) { target.set(target_name, std::move(new_value)); }
            };
        }
    }

    PropertyBinding::PropertyBinding(LiveObject &object_a, LiveObject::subscription_id subscription_a,
                                     LiveObject &object_b, LiveObject::subscription_id subscription_b)
        : _object_a{&object_a}, _lifetime_a{object_a.lifetime()}, _subscription_a{subscription_a},
          _object_b{&object_b}, _lifetime_b{object_b.lifetime()}, _subscription_b{subscription_b} {
    }

    void PropertyBinding::unbind() {
        if (!is_bound()) { return; }
        // A destroyed object took its subscriptions with it
        if (!_lifetime_a.expired()) { _object_a->unsubscribe(_subscription_a); }
        if (!_lifetime_b.expired()) { _object_b->unsubscribe(_subscription_b); }
        _object_a = nullptr;
        _object_b = nullptr;
        _lifetime_a.reset();
        _lifetime_b.reset();
        _subscription_a = EventEmitter::INVALID_SUBSCRIPTION;
        _subscription_b = EventEmitter::INVALID_SUBSCRIPTION;
    }

    PropertyBinding bind_properties(LiveObject &object_a, const std::string &name_a,
                                    LiveObject &object_b, const std::string &name_b) {
        auto update_a_from_b{make_update(object_a, name_a, object_b, name_b)};
        auto update_b_from_a{make_update(object_b, name_b, object_a, name_a)};
        auto subscription_a{object_a.on_change(name_a, update_b_from_a)};
        auto subscription_b{object_b.on_change(name_b, update_a_from_b)};
        update_a_from_b();
        return PropertyBinding{object_a, subscription_a, object_b, subscription_b};
    }
}
