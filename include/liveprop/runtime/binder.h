#ifndef LIVEPROP_BINDER_H
#define LIVEPROP_BINDER_H

#include <liveprop/liveprop_export.h>
#include <liveprop/types/live_object.h>

#include <memory>
#include <string>

namespace liveprop {
    /**
     * The pair of change subscriptions created by bind_properties.
     *
     * Dropping the handle leaves the binding in place, the binding lives as long as the objects do. Call unbind
     * to remove both subscriptions. Once either object is destroyed the binding stops propagating, and unbind
     * only removes the subscription of the object that is left.
     */
    class LIVEPROP_EXPORT PropertyBinding {
    public:
        PropertyBinding() = default;

        PropertyBinding(LiveObject &object_a, LiveObject::subscription_id subscription_a, LiveObject &object_b,
                        LiveObject::subscription_id subscription_b);

        void unbind();

        [[nodiscard]] bool is_bound() const { return _object_a != nullptr; }

    private:
        LiveObject *_object_a{nullptr};
        std::weak_ptr<void> _lifetime_a{};
        LiveObject::subscription_id _subscription_a{EventEmitter::INVALID_SUBSCRIPTION};
        LiveObject *_object_b{nullptr};
        std::weak_ptr<void> _lifetime_b{};
        LiveObject::subscription_id _subscription_b{EventEmitter::INVALID_SUBSCRIPTION};
    };

    /**
     * Bind the property name_a of object_a to the property name_b of object_b.
     *
     * Initially object_a takes on the value of object_b's property, after that a change to either property is
     * written to the other. A write only happens when the two values differ, which stops the two subscriptions
     * from feeding each other. That check does not protect against cycles formed through computed property
     * dependencies.
     */
    LIVEPROP_EXPORT PropertyBinding bind_properties(LiveObject &object_a, const std::string &name_a,
                                                    LiveObject &object_b, const std::string &name_b);
}

#endif  // LIVEPROP_BINDER_H
