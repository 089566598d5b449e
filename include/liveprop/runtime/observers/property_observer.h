#ifndef LIVEPROP_PROPERTY_OBSERVER_H
#define LIVEPROP_PROPERTY_OBSERVER_H

#include <liveprop/liveprop_export.h>
#include <liveprop/types/property_value.h>

#include <memory>
#include <string>

namespace liveprop {
    class LiveObject;

    /**
     * Hooks into the set / notify cycle of a LiveObject. All methods default to no-ops.
     *
     * The before / after pairs nest: a set brackets the change notification it causes, and a change notification
     * brackets the notifications of its dependents. The after hooks are only called when the bracketed work
     * completes normally.
     */
    struct LIVEPROP_EXPORT PropertyObserver {
        using s_ptr = std::shared_ptr<PropertyObserver>;

        virtual ~PropertyObserver() = default;

        virtual void on_before_set(LiveObject &, const std::string &, const PropertyValue &) {
        };

        virtual void on_after_set(LiveObject &, const std::string &, bool) {
        };

        // A write to a computed property without a setter, the write is dropped.
        virtual void on_read_only_write(LiveObject &, const std::string &) {
        };

        virtual void on_before_change_notification(LiveObject &, const std::string &) {
        };

        virtual void on_after_change_notification(LiveObject &, const std::string &) {
        };
    };
}

#endif  // LIVEPROP_PROPERTY_OBSERVER_H
