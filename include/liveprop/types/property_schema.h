#ifndef LIVEPROP_PROPERTY_SCHEMA_H
#define LIVEPROP_PROPERTY_SCHEMA_H

#include <liveprop/liveprop_export.h>
#include <liveprop/types/property_descriptor.h>

#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace liveprop {
    /**
     * The fully resolved property table of a LiveObject.
     *
     * A schema is an ordered list of (name, descriptor) entries. Derived schemas are produced with extend, which
     * starts from this schema and applies a set of overrides: an override replaces the base entry of the same
     * name in place, new names are appended. Extending can be chained, the last level wins, so a LiveObject never
     * has to walk a chain of definitions to discover its computed properties.
     */
    class LIVEPROP_EXPORT PropertySchema {
    public:
        using entry_t = std::pair<std::string, PropertyDescriptor>;
        using const_iterator = std::vector<entry_t>::const_iterator;

        PropertySchema() = default;

        PropertySchema(std::initializer_list<entry_t> entries);

        /**
         * Add the property, or replace the descriptor of an existing property keeping its position.
         */
        PropertySchema &define(std::string name, PropertyDescriptor descriptor);

        [[nodiscard]] PropertySchema extend(const PropertySchema &overrides) const;

        [[nodiscard]] bool contains(const std::string &name) const;

        [[nodiscard]] const PropertyDescriptor *find(const std::string &name) const;

        [[nodiscard]] PropertyDescriptor *find(const std::string &name);

        [[nodiscard]] std::vector<std::string> names() const;

        [[nodiscard]] std::size_t size() const { return _entries.size(); }

        [[nodiscard]] bool empty() const { return _entries.empty(); }

        [[nodiscard]] const_iterator begin() const { return _entries.begin(); }

        [[nodiscard]] const_iterator end() const { return _entries.end(); }

    private:
        std::vector<entry_t> _entries{};
        std::unordered_map<std::string, std::size_t> _positions{};
    };
}

#endif  // LIVEPROP_PROPERTY_SCHEMA_H
