#include <liveprop/types/property_schema.h>

#include <algorithm>
#include <iterator>

namespace liveprop {
    PropertySchema::PropertySchema(std::initializer_list<entry_t> entries) {
        for (const auto &[name, descriptor] : entries) { define(name, descriptor); }
    }

    PropertySchema &PropertySchema::define(std::string name, PropertyDescriptor descriptor) {
        auto it{_positions.find(name)};
        if (it != _positions.end()) {
            _entries[it->second].second = std::move(descriptor);
        } else {
            _positions.emplace(name, _entries.size());
            _entries.emplace_back(std::move(name), std::move(descriptor));
        }
        return *this;
    }

    PropertySchema PropertySchema::extend(const PropertySchema &overrides) const {
        PropertySchema result{*this};
        for (const auto &[name, descriptor] : overrides) { result.define(name, descriptor); }
        return result;
    }

    bool PropertySchema::contains(const std::string &name) const {
        return _positions.contains(name);
    }

    const PropertyDescriptor *PropertySchema::find(const std::string &name) const {
        auto it{_positions.find(name)};
        return it == _positions.end() ? nullptr : &_entries[it->second].second;
    }

    PropertyDescriptor *PropertySchema::find(const std::string &name) {
        auto it{_positions.find(name)};
        return it == _positions.end() ? nullptr : &_entries[it->second].second;
    }

    std::vector<std::string> PropertySchema::names() const {
        std::vector<std::string> result;
        result.reserve(_entries.size());
        std::transform(_entries.begin(), _entries.end(), std::back_inserter(result),
                       [](const entry_t &entry) { return entry.first; });
        return result;
    }
}
