#ifndef LIVEPROP_PROPERTY_DESCRIPTOR_H
#define LIVEPROP_PROPERTY_DESCRIPTOR_H

#include <liveprop/types/computed_property.h>
#include <liveprop/types/property_value.h>

#include <variant>

namespace liveprop {
    /**
     * What sits behind a property name, either a stored value or a computed property.
     */
    using PropertyDescriptor = std::variant<PropertyValue, ComputedProperty>;

    [[nodiscard]] inline bool is_computed(const PropertyDescriptor &descriptor) {
        return std::holds_alternative<ComputedProperty>(descriptor);
    }

    [[nodiscard]] inline const ComputedProperty *as_computed(const PropertyDescriptor &descriptor) {
        return std::get_if<ComputedProperty>(&descriptor);
    }
}

#endif  // LIVEPROP_PROPERTY_DESCRIPTOR_H
