#include <liveprop/types/dependency_index.h>

#include <algorithm>
#include <functional>

namespace liveprop {
    DependencyIndex DependencyIndex::build(const PropertySchema &schema) {
        DependencyIndex index;
        for (const auto &[name, descriptor] : schema) {
            auto computed{as_computed(descriptor)};
            if (computed == nullptr) { continue; }
            for (const auto &watch : computed->watches) {
                auto [it, inserted] = index._watchers.try_emplace(watch);
                if (inserted) { index._watched_order.push_back(watch); }
                it->second.push_back(name);
            }
        }
        return index;
    }

    const DependencyIndex::dependents_t &DependencyIndex::dependents(const std::string &name) const {
        static const dependents_t no_dependents{};
        auto it{_watchers.find(name)};
        return it == _watchers.end() ? no_dependents : it->second;
    }

    std::optional<std::vector<std::string>> DependencyIndex::find_cycle() const {
        enum class Mark : char { IN_PROGRESS, DONE };
        std::unordered_map<std::string, Mark> marks;
        std::vector<std::string> path;

        std::function<std::optional<std::vector<std::string>>(const std::string &)> visit =
            [&](const std::string &name) -> std::optional<std::vector<std::string>> {
                auto mark{marks.find(name)};
                if (mark != marks.end()) {
                    if (mark->second == Mark::DONE) { return std::nullopt; }
                    // Back edge, the cycle is the tail of the path starting at name
                    std::vector<std::string> cycle{std::find(path.begin(), path.end(), name), path.end()};
                    cycle.push_back(name);
                    return cycle;
                }
                marks.emplace(name, Mark::IN_PROGRESS);
                path.push_back(name);
                for (const auto &dependent : dependents(name)) {
                    if (auto cycle{visit(dependent)}) { return cycle; }
                }
                path.pop_back();
                marks[name] = Mark::DONE;
                return std::nullopt;
            };

        for (const auto &name : _watched_order) {
            if (auto cycle{visit(name)}) { return cycle; }
        }
        return std::nullopt;
    }
}
