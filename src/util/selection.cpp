#include <kapla/selection.hpp>
#include <kapla/log.hpp>
#include <vector>

namespace kapla {

Result<std::set<std::string>> select_packages(const DependencyGraph& graph,
                                              const std::set<std::string>& include,
                                              const std::set<std::string>& exclude) {
    for (const auto& name : exclude) {
        if (!graph.contains(name)) {
            log::warn("ignoring unknown excluded package '%s'", name.c_str());
        }
    }

    std::set<std::string> selected;

    if (include.empty()) {
        // Excluding a package drops its whole dependent subtree
        std::set<std::string> dropped;
        for (const auto& name : exclude) {
            if (!graph.contains(name)) continue;
            dropped.insert(name);
            for (const auto& dependent : graph.transitive_dependents(name)) {
                if (!exclude.count(dependent) && dropped.insert(dependent).second) {
                    log::info("skipping '%s': depends on excluded package '%s'",
                              dependent.c_str(), name.c_str());
                }
            }
        }
        for (const auto& name : graph.names()) {
            if (!dropped.count(name)) selected.insert(name);
        }
        return Result<std::set<std::string>>::ok(std::move(selected));
    }

    std::vector<std::string> todo;
    for (const auto& name : include) {
        if (!graph.contains(name)) {
            return KaplaError{KaplaError::NotFound,
                "no package named '" + name + "'",
                "run `kapla list` to see the workspace members"}.with_subjects({name});
        }
        if (exclude.count(name)) {
            return KaplaError{KaplaError::Selection,
                "package '" + name + "' is both included and excluded"}
                .with_subjects({name});
        }
        if (selected.insert(name).second) todo.push_back(name);
    }

    // Transitive closure over internal dependencies
    while (!todo.empty()) {
        std::string name = std::move(todo.back());
        todo.pop_back();
        for (const auto& dep : graph.dependencies(name)) {
            if (exclude.count(dep)) {
                return KaplaError{KaplaError::Selection,
                    "package '" + name + "' requires excluded package '" + dep + "'",
                    "an excluded package cannot be a dependency of a selected one"}
                    .with_subjects({name, dep});
            }
            if (selected.insert(dep).second) todo.push_back(dep);
        }
    }

    log::debug("selected %zu of %zu packages", selected.size(), graph.size());
    return Result<std::set<std::string>>::ok(std::move(selected));
}

} // namespace kapla
