#ifndef LIVEPROP_DEPENDENCY_INDEX_H
#define LIVEPROP_DEPENDENCY_INDEX_H

#include <liveprop/liveprop_export.h>
#include <liveprop/types/property_schema.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace liveprop {
    /**
     * Reverse dependency map of a schema: for each watched property name, the names of the computed properties
     * that declare it in their watches.
     *
     * The index is built once from a flattened schema and is read-only afterwards. The order of the dependents is
     * schema order, then watch order. Callers must not rely on it, sibling dependents are independent of each
     * other.
     */
    class LIVEPROP_EXPORT DependencyIndex {
    public:
        using dependents_t = std::vector<std::string>;

        DependencyIndex() = default;

        [[nodiscard]] static DependencyIndex build(const PropertySchema &schema);

        /**
         * The computed properties that watch name, empty when nothing watches it.
         */
        [[nodiscard]] const dependents_t &dependents(const std::string &name) const;

        [[nodiscard]] bool is_watched(const std::string &name) const { return _watchers.contains(name); }

        [[nodiscard]] std::size_t size() const { return _watchers.size(); }

        /**
         * Search the index for a dependency cycle.
         * Returns the names on the first cycle found with the starting name repeated at the end
         * (for example a -> b -> a), or nullopt when the dependency graph is acyclic.
         */
        [[nodiscard]] std::optional<std::vector<std::string>> find_cycle() const;

    private:
        std::unordered_map<std::string, dependents_t> _watchers{};
        // Watched names in the order they were first seen, keeps find_cycle deterministic.
        std::vector<std::string> _watched_order{};
    };
}

#endif  // LIVEPROP_DEPENDENCY_INDEX_H
