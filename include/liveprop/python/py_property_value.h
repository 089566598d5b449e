/*
 * Conversion between Python objects and PropertyValue for the _liveprop module.
 *
 * Python builtins are held as the native property types (bool, lp_int, lp_float, lp_string) so that values set
 * from Python compare equal to values set from C++. Any other object is held as an nb::object and compared with
 * Python equality. None is the unset value.
 */
#ifndef LIVEPROP_PY_PROPERTY_VALUE_H
#define LIVEPROP_PY_PROPERTY_VALUE_H

#include <nanobind/nanobind.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <liveprop/types/property_value.h>

namespace nb = nanobind;
using namespace nb::literals;

namespace liveprop {
    template<>
    struct property_traits<nb::object> {
        static bool equal(const nb::object &lhs, const nb::object &rhs) { return lhs.equal(rhs); }

        static std::string to_string(const nb::object &value) { return nb::str(value).c_str(); }
    };

    inline PropertyValue to_property_value(nb::handle value) {
        if (value.is_none()) { return PropertyValue{}; }
        if (nb::isinstance<nb::bool_>(value)) { return make_property_value(nb::cast<bool>(value)); }
        if (nb::isinstance<nb::int_>(value)) { return make_property_value(nb::cast<lp_int>(value)); }
        if (nb::isinstance<nb::float_>(value)) { return make_property_value(nb::cast<lp_float>(value)); }
        if (nb::isinstance<nb::str>(value)) { return make_property_value(nb::cast<lp_string>(value)); }
        return make_property_value(nb::borrow<nb::object>(value));
    }

    inline nb::object to_python(const PropertyValue &value) {
        if (value.is_un_set()) { return nb::none(); }
        if (value.is<bool>()) { return nb::bool_(value.as<bool>()); }
        if (value.is<lp_int>()) { return nb::int_(value.as<lp_int>()); }
        if (value.is<lp_float>()) { return nb::float_(value.as<lp_float>()); }
        if (value.is<lp_string>()) { return nb::str(value.as<lp_string>().c_str()); }
        if (value.is<nb::object>()) { return value.as<nb::object>(); }
        // A C++ type without a Python mapping, expose its printable form
        return nb::str(value.to_string().c_str());
    }
}

#endif  // LIVEPROP_PY_PROPERTY_VALUE_H
