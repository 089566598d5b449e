#ifndef LIVEPROP_LIVE_OBJECT_H
#define LIVEPROP_LIVE_OBJECT_H

#include <liveprop/liveprop_export.h>
#include <liveprop/runtime/event_emitter.h>
#include <liveprop/runtime/observers/property_observer.h>
#include <liveprop/types/dependency_index.h>
#include <liveprop/types/property_schema.h>
#include <liveprop/types/property_value.h>

#include <concepts>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace liveprop {
    struct LIVEPROP_EXPORT LiveObjectOptions {
        // Used to identify the object in traces and error messages.
        std::string label{};

        // Reject schemas whose computed properties depend on each other in a cycle.
        bool detect_dependency_cycles{false};

        /**
         * Options taken from the environment:
         * LIVEPROP_DETECT_CYCLES - when set, detect_dependency_cycles is turned on.
         */
        [[nodiscard]] static LiveObjectOptions from_environment();
    };

    /**
     * An object with change notifications and computed properties.
     *
     * set() triggers a change event for the modified property, the event name is the property name followed by
     * "Changed" (see change_event_name). The change event is then triggered, depth first, for every computed
     * property that watches the property, and for their watchers in turn. Handlers receive no payload, they are
     * expected to call get() for the new value.
     *
     * Example:
     *     LiveObject obj{PropertySchema{
     *         {"prop1", make_property_value("apple")},
     *         {"prop2", prop({"prop1"}, [](const LiveObject &self) {
     *             return make_property_value("pine" + self.get("prop1").as<lp_string>());
     *         })}
     *     }};
     *     obj.get("prop1");  // apple
     *     obj.get("prop2");  // pineapple
     *
     * The dependency index is built once, at construction, from the flattened schema. No cycle check is made
     * while notifying: computed properties that watch each other in a cycle recurse until the stack is
     * exhausted, unless LiveObjectOptions::detect_dependency_cycles rejects the schema up front.
     *
     * Computed getters and setters, handlers and bindings refer to the object by identity, so a LiveObject can be
     * neither copied nor moved.
     */
    class LIVEPROP_EXPORT LiveObject {
    public:
        using subscription_id = EventEmitter::subscription_id;
        using handler_t = EventEmitter::handler_t;

        static constexpr std::string_view CHANGE_EVENT_SUFFIX{"Changed"};

        explicit LiveObject(const PropertySchema &schema, LiveObjectOptions options = {});

        /**
         * Construct from schema with init_props applied on top, the same as constructing from
         * schema.extend(init_props).
         */
        LiveObject(const PropertySchema &schema, const PropertySchema &init_props, LiveObjectOptions options = {});

        virtual ~LiveObject() = default;

        LiveObject(const LiveObject &) = delete;

        LiveObject &operator=(const LiveObject &) = delete;

        LiveObject(LiveObject &&) = delete;

        LiveObject &operator=(LiveObject &&) = delete;

        [[nodiscard]] static std::string change_event_name(std::string_view name);

        /**
         * The value of the property, the result of the getter for a computed property.
         * A name that was never declared or set gives an unset value.
         */
        [[nodiscard]] PropertyValue get(const std::string &name) const;

        template<typename T>
        [[nodiscard]] T get_as(const std::string &name) const { return get(name).as<T>(); }

        /**
         * Set the value of the property.
         * For a computed property the setter is called with value and the property is considered changed.
         * A computed property without a setter is read-only, the write is silently dropped and no event fires.
         * A stored property (or a name not yet known) is overwritten, without comparing the old value.
         */
        void set(const std::string &name, PropertyValue value);

        template<typename T>
            requires (!std::same_as<T, PropertyValue>)
        void set(const std::string &name, T value) { set(name, make_property_value(std::move(value))); }

        /**
         * Fire the change event of name, then of all the properties watching it.
         */
        void trigger_change(const std::string &name);

        // Fire an arbitrary event on this object.
        void trigger(const std::string &event);

        subscription_id subscribe(const std::string &event, handler_t handler);

        // Subscribe to the change event of the property name.
        subscription_id on_change(const std::string &name, handler_t handler);

        bool unsubscribe(subscription_id id);

        std::size_t unsubscribe_all(const std::string &event);

        [[nodiscard]] std::size_t subscriber_count(const std::string &event) const;

        [[nodiscard]] bool contains(const std::string &name) const;

        [[nodiscard]] bool is_computed(const std::string &name) const;

        [[nodiscard]] bool is_read_only(const std::string &name) const;

        [[nodiscard]] std::vector<std::string> property_names() const;

        [[nodiscard]] const DependencyIndex &dependency_index() const { return _dependency_index; }

        [[nodiscard]] const LiveObjectOptions &options() const { return _options; }

        [[nodiscard]] const std::string &label() const { return _options.label; }

        /**
         * A token that expires when this object is destroyed. Closures that refer to the object from elsewhere,
         * such as the handlers installed by bind_properties, hold it to find out whether the object is still alive.
         */
        [[nodiscard]] std::weak_ptr<void> lifetime() const { return _lifetime; }

        void add_observer(PropertyObserver::s_ptr observer);

        void remove_observer(const PropertyObserver::s_ptr &observer);

    private:
        template<typename Op>
        void _notify_observers(Op op);

        LiveObjectOptions _options;
        PropertySchema _properties;
        DependencyIndex _dependency_index;
        EventEmitter _events{};
        std::vector<PropertyObserver::s_ptr> _observers{};
        // Declared last so it expires first on destruction.
        std::shared_ptr<void> _lifetime{std::make_shared<char>('\0')};
    };
}

#endif  // LIVEPROP_LIVE_OBJECT_H
