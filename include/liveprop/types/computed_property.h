#ifndef LIVEPROP_COMPUTED_PROPERTY_H
#define LIVEPROP_COMPUTED_PROPERTY_H

#include <liveprop/liveprop_export.h>
#include <liveprop/types/property_value.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace liveprop {
    class LiveObject;

    /**
     * A property whose value is derived from other properties.
     *
     * watches: the names of the properties this property depends on. A change to any of them triggers a change
     *          event for this property. May be empty, the property is then only re-evaluated when read.
     * getter:  computes the value, it is called with the owning object and may read any other property.
     * setter:  optional, takes the new value and stores whatever is appropriate on the owning object.
     *          Without a setter the property is read-only and writes to it are dropped.
     */
    struct LIVEPROP_EXPORT ComputedProperty {
        using getter_t = std::function<PropertyValue(const LiveObject &)>;
        using setter_t = std::function<void(LiveObject &, const PropertyValue &)>;

        std::vector<std::string> watches{};
        getter_t getter{};
        std::optional<setter_t> setter{};

        [[nodiscard]] bool is_read_only() const { return !setter.has_value(); }
    };

    /**
     * Declare a computed property, throws std::invalid_argument if the getter is empty.
     */
    LIVEPROP_EXPORT ComputedProperty prop(std::vector<std::string> watches, ComputedProperty::getter_t getter,
                                          std::optional<ComputedProperty::setter_t> setter = std::nullopt);
}

#endif  // LIVEPROP_COMPUTED_PROPERTY_H
