#include <liveprop/python/py_property_value.h>
#include <liveprop/runtime/binder.h>
#include <liveprop/runtime/observers/property_trace.h>
#include <liveprop/types/live_object.h>

#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string_view.h>

namespace {
    using namespace liveprop;

    nb::object self_ref(const LiveObject &self) {
        return nb::cast(const_cast<LiveObject *>(&self), nb::rv_policy::reference);
    }

    ComputedProperty py_prop(std::vector<std::string> watches, nb::callable getter, std::optional<nb::callable> setter) {
        ComputedProperty::getter_t getter_{[getter](const LiveObject &self) {
            return to_property_value(getter(self_ref(self)));
        }};
        std::optional<ComputedProperty::setter_t> setter_{};
        if (setter) {
            setter_ = [setter = *setter](LiveObject &self, const PropertyValue &value) {
                setter(self_ref(self), to_python(value));
            };
        }
        return prop(std::move(watches), std::move(getter_), std::move(setter_));
    }

    PropertySchema to_schema(const nb::dict &properties) {
        PropertySchema schema{};
        for (auto [key, value] : properties) {
            auto name{nb::cast<std::string>(key)};
            if (nb::isinstance<ComputedProperty>(value)) {
                schema.define(std::move(name), nb::cast<ComputedProperty>(value));
            } else {
                schema.define(std::move(name), to_property_value(value));
            }
        }
        return schema;
    }

    EventEmitter::handler_t to_handler(nb::callable handler) {
        return [handler = std::move(handler)]() { handler(); };
    }
}

void export_types(nb::module_ &m) {
    using namespace liveprop;

    nb::class_<ComputedProperty>(m, "ComputedProperty")
        .def_ro("watches", &ComputedProperty::watches)
        .def_prop_ro("is_read_only", &ComputedProperty::is_read_only);

    m.def("prop", &py_prop, "watches"_a, "getter"_a, "setter"_a = nb::none(),
          "Declare a computed property, the getter is called with the owning LiveObject");

    nb::class_<PropertyObserver>(m, "PropertyObserver");

    nb::class_<PropertyTrace, PropertyObserver>(m, "PropertyTrace")
        .def(nb::init<const std::optional<std::string> &, bool, bool>(),
             "filter"_a = nb::none(), "set"_a = true, "notify"_a = true)
        .def_static("set_print_values", &PropertyTrace::set_print_values)
        .def_static("set_use_logger", &PropertyTrace::set_use_logger);

    nb::class_<LiveObject>(m, "LiveObject", nb::is_weak_referenceable())
        .def("__init__",
             [](LiveObject *self, nb::dict properties, std::string label, bool detect_dependency_cycles) {
                 new (self) LiveObject(to_schema(properties),
                                       LiveObjectOptions{std::move(label), detect_dependency_cycles});
             },
             "properties"_a = nb::dict(), "label"_a = "", "detect_dependency_cycles"_a = false)
        .def("get", [](const LiveObject &self, const std::string &name) { return to_python(self.get(name)); },
             "name"_a)
        .def("set", [](LiveObject &self, const std::string &name, nb::handle value) {
                 self.set(name, to_property_value(value));
             }, "name"_a, "value"_a)
        .def("trigger_change", &LiveObject::trigger_change, "name"_a)
        .def("trigger", &LiveObject::trigger, "event"_a)
        .def("subscribe", [](LiveObject &self, const std::string &event, nb::callable handler) {
                 return self.subscribe(event, to_handler(std::move(handler)));
             }, "event"_a, "handler"_a)
        .def("on_change", [](LiveObject &self, const std::string &name, nb::callable handler) {
                 return self.on_change(name, to_handler(std::move(handler)));
             }, "name"_a, "handler"_a)
        .def("unsubscribe", &LiveObject::unsubscribe, "id"_a)
        .def("unsubscribe_all", &LiveObject::unsubscribe_all, "event"_a)
        .def("subscriber_count", &LiveObject::subscriber_count, "event"_a)
        .def("contains", &LiveObject::contains, "name"_a)
        .def("is_computed", &LiveObject::is_computed, "name"_a)
        .def("is_read_only", &LiveObject::is_read_only, "name"_a)
        .def_prop_ro("property_names", &LiveObject::property_names)
        .def_prop_ro("label", &LiveObject::label)
        .def("add_observer", &LiveObject::add_observer, "observer"_a)
        .def("remove_observer", &LiveObject::remove_observer, "observer"_a)
        .def_static("change_event_name", &LiveObject::change_event_name, "name"_a);

    nb::class_<PropertyBinding>(m, "PropertyBinding")
        .def("unbind", &PropertyBinding::unbind)
        .def_prop_ro("is_bound", &PropertyBinding::is_bound);

    m.def("bind_properties", &bind_properties, "object_a"_a, "name_a"_a, "object_b"_a, "name_b"_a,
          nb::keep_alive<0, 1>(), nb::keep_alive<0, 3>(),
          "Bind name_a of object_a to name_b of object_b, object_a takes object_b's value first");
}
