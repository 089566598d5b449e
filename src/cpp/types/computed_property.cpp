#include <liveprop/types/computed_property.h>
#include <liveprop/util/errors.h>

namespace liveprop {
    ComputedProperty prop(std::vector<std::string> watches, ComputedProperty::getter_t getter,
                          std::optional<ComputedProperty::setter_t> setter) {
        if (!getter) { throw_error<std::invalid_argument>("A computed property requires a getter"); }
        if (setter && !*setter) { setter.reset(); }
        return ComputedProperty{std::move(watches), std::move(getter), std::move(setter)};
    }
}
