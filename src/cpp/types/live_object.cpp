#include <liveprop/types/live_object.h>
#include <liveprop/util/errors.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstdlib>

namespace liveprop {
    template<typename Op>
    void LiveObject::_notify_observers(Op op) {
        if (_observers.empty()) { return; }
        auto observers{_observers};
        for (const auto &observer : observers) { op(*observer); }
    }

    LiveObjectOptions LiveObjectOptions::from_environment() {
        LiveObjectOptions options{};
        options.detect_dependency_cycles = std::getenv("LIVEPROP_DETECT_CYCLES") != nullptr;
        return options;
    }

    LiveObject::LiveObject(const PropertySchema &schema, LiveObjectOptions options)
        : _options{std::move(options)},
          _properties{schema},
          _dependency_index{DependencyIndex::build(_properties)} {
        if (_options.detect_dependency_cycles) {
            if (auto cycle{_dependency_index.find_cycle()}) {
                throw_error<dependency_cycle_error>(
                    "Computed properties of '{}' form a dependency cycle: {}", _options.label, fmt::join(*cycle, " -> "));
            }
        }
    }

    LiveObject::LiveObject(const PropertySchema &schema, const PropertySchema &init_props, LiveObjectOptions options)
        : LiveObject(schema.extend(init_props), std::move(options)) {
    }

    std::string LiveObject::change_event_name(std::string_view name) {
        return fmt::format("{}{}", name, CHANGE_EVENT_SUFFIX);
    }

    PropertyValue LiveObject::get(const std::string &name) const {
        auto descriptor{_properties.find(name)};
        if (descriptor == nullptr) { return PropertyValue{}; }
        if (auto computed{as_computed(*descriptor)}) {
            // A getter may add properties to the table, so do not call it through the descriptor
            auto getter{computed->getter};
            return getter(*this);
        }
        return std::get<PropertyValue>(*descriptor);
    }

    void LiveObject::set(const std::string &name, PropertyValue value) {
        _notify_observers([&](PropertyObserver &o) { o.on_before_set(*this, name, value); });
        bool changed{false};
        auto descriptor{_properties.find(name)};
        if (descriptor != nullptr && liveprop::is_computed(*descriptor)) {
            const auto &computed{std::get<ComputedProperty>(*descriptor)};
            if (computed.setter) {
                // The setter may add properties to the table, so do not call it through the descriptor
                auto setter{*computed.setter};
                setter(*this, value);
                changed = true;
            } else {
                _notify_observers([&](PropertyObserver &o) { o.on_read_only_write(*this, name); });
            }
        } else if (descriptor != nullptr) {
            *descriptor = std::move(value);
            changed = true;
        } else {
            _properties.define(name, std::move(value));
            changed = true;
        }
        if (changed) { trigger_change(name); }
        _notify_observers([&](PropertyObserver &o) { o.on_after_set(*this, name, changed); });
    }

    void LiveObject::trigger_change(const std::string &name) {
        _notify_observers([&](PropertyObserver &o) { o.on_before_change_notification(*this, name); });
        _events.fire(change_event_name(name));
        for (const auto &watcher : _dependency_index.dependents(name)) { trigger_change(watcher); }
        _notify_observers([&](PropertyObserver &o) { o.on_after_change_notification(*this, name); });
    }

    void LiveObject::trigger(const std::string &event) {
        _events.fire(event);
    }

    LiveObject::subscription_id LiveObject::subscribe(const std::string &event, handler_t handler) {
        return _events.subscribe(event, std::move(handler));
    }

    LiveObject::subscription_id LiveObject::on_change(const std::string &name, handler_t handler) {
        return _events.subscribe(change_event_name(name), std::move(handler));
    }

    bool LiveObject::unsubscribe(subscription_id id) {
        return _events.unsubscribe(id);
    }

    std::size_t LiveObject::unsubscribe_all(const std::string &event) {
        return _events.unsubscribe_all(event);
    }

    std::size_t LiveObject::subscriber_count(const std::string &event) const {
        return _events.subscriber_count(event);
    }

    bool LiveObject::contains(const std::string &name) const {
        return _properties.contains(name);
    }

    bool LiveObject::is_computed(const std::string &name) const {
        auto descriptor{_properties.find(name)};
        return descriptor != nullptr && liveprop::is_computed(*descriptor);
    }

    bool LiveObject::is_read_only(const std::string &name) const {
        auto descriptor{_properties.find(name)};
        if (descriptor == nullptr) { return false; }
        auto computed{as_computed(*descriptor)};
        return computed != nullptr && computed->is_read_only();
    }

    std::vector<std::string> LiveObject::property_names() const {
        return _properties.names();
    }

    void LiveObject::add_observer(PropertyObserver::s_ptr observer) {
        if (observer) { _observers.push_back(std::move(observer)); }
    }

    void LiveObject::remove_observer(const PropertyObserver::s_ptr &observer) {
        auto it{std::find(_observers.begin(), _observers.end(), observer)};
        if (it != _observers.end()) { _observers.erase(it); }
    }

}
