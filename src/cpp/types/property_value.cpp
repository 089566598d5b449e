#include <liveprop/types/property_value.h>

namespace liveprop
{

    PropertyValue::PropertyValue(const PropertyValue &value)
        : _pimpl{value._pimpl ? value._pimpl->clone() : nullptr} {}

    PropertyValue &PropertyValue::operator=(const PropertyValue &value) {
        if (this == &value) { return *this; }
        auto property_concept{value._pimpl ? value._pimpl->clone() : nullptr};
        _pimpl.swap(property_concept);
        return *this;
        // The previous value is released when property_concept goes out of scope
    }

    bool PropertyValue::operator==(const PropertyValue &other) const {
        if (is_un_set() || other.is_un_set()) { return is_un_set() && other.is_un_set(); }
        return _pimpl->operator==(other);
    }

    std::string PropertyValue::type_name() const {
        return is_un_set() ? std::string{"<unset>"} : std::string{_pimpl->type().name()};
    }

    std::string PropertyValue::to_string() const {
        return is_un_set() ? std::string{"<unset>"} : _pimpl->to_string();
    }

}  // namespace liveprop
