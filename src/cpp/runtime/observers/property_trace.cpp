#include <liveprop/runtime/observers/property_trace.h>
#include <liveprop/types/live_object.h>

#include <fmt/format.h>

#include <cstdlib>
#include <iostream>

namespace liveprop {

    // Static member initialization
    bool PropertyTrace::_print_values = false;
    bool PropertyTrace::_use_logger = true;

    PropertyTrace::PropertyTrace(const std::optional<std::string> &filter, bool set, bool notify)
        : _filter(filter), _set(set), _notify(notify) {
    }

    std::shared_ptr<PropertyTrace> PropertyTrace::from_environment() {
        auto trace{std::getenv("LIVEPROP_TRACE")};
        if (trace == nullptr) { return nullptr; }
        if (std::getenv("LIVEPROP_TRACE_VALUES") != nullptr) { set_print_values(true); }
        std::string filter{trace};
        return std::make_shared<PropertyTrace>(filter.empty() ? std::nullopt : std::optional<std::string>{filter});
    }

    void PropertyTrace::set_print_values(bool value) {
        _print_values = value;
    }

    void PropertyTrace::set_use_logger(bool value) {
        _use_logger = value;
    }

    void PropertyTrace::_print(const LiveObject &object, const std::string &msg) const {
        const auto &label{object.label().empty() ? std::string{"LiveObject"} : object.label()};
        std::string formatted = fmt::format("[{}] {}{}", label, std::string(static_cast<size_t>(_depth) * 2, ' '), msg);
        if (_use_logger) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    bool PropertyTrace::_should_log(const std::string &name) const {
        if (!_filter.has_value()) {
            return true;
        }
        return name.find(_filter.value()) != std::string::npos;
    }

    void PropertyTrace::on_before_set(LiveObject &object, const std::string &name, const PropertyValue &value) {
        if (_set && _should_log(name)) {
            _print(object, _print_values ? fmt::format(">> SET {} = {}", name, value) : fmt::format(">> SET {}", name));
        }
        ++_depth;
    }

    void PropertyTrace::on_after_set(LiveObject &object, const std::string &name, bool changed) {
        --_depth;
        if (_set && _should_log(name)) {
            _print(object, fmt::format("<< SET {}{}", name, changed ? "" : " (no change)"));
        }
    }

    void PropertyTrace::on_read_only_write(LiveObject &object, const std::string &name) {
        if (_set && _should_log(name)) {
            _print(object, fmt::format("Ignored write to read-only property {}", name));
        }
    }

    void PropertyTrace::on_before_change_notification(LiveObject &object, const std::string &name) {
        if (_notify && _should_log(name)) {
            auto event{LiveObject::change_event_name(name)};
            _print(object, _print_values ? fmt::format("{} -> {}", event, object.get(name)) : event);
        }
        ++_depth;
    }

    void PropertyTrace::on_after_change_notification(LiveObject &, const std::string &) {
        --_depth;
    }

} // namespace liveprop
