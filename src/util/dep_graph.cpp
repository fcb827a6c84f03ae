#include <kapla/dep_graph.hpp>
#include <kapla/log.hpp>
#include <algorithm>

namespace kapla {

// ---------------------------------------------------------------------------
// ExecutionPlan
// ---------------------------------------------------------------------------

size_t ExecutionPlan::package_count() const {
    size_t n = 0;
    for (const auto& batch : batches) n += batch.size();
    return n;
}

std::vector<std::string> ExecutionPlan::flatten() const {
    std::vector<std::string> out;
    out.reserve(package_count());
    for (const auto& batch : batches) {
        out.insert(out.end(), batch.begin(), batch.end());
    }
    return out;
}

// ---------------------------------------------------------------------------
// DependencyGraph::build
// ---------------------------------------------------------------------------

Result<DependencyGraph> DependencyGraph::build(std::vector<Manifest> packages) {
    // 1. Names are unique; report the first repeat in input order
    std::unordered_map<std::string, size_t> seen;
    for (size_t i = 0; i < packages.size(); ++i) {
        const auto& name = packages[i].package.name;
        auto [it, inserted] = seen.emplace(name, i);
        if (!inserted) {
            return KaplaError{KaplaError::Duplicate,
                "duplicate package name '" + name + "'",
                "declared in " + packages[it->second].path + " and " +
                packages[i].path}.with_subjects({name});
        }
    }

    // Insert in name order so node ids compare like names
    std::sort(packages.begin(), packages.end(),
        [](const Manifest& a, const Manifest& b) {
            return a.package.name < b.package.name;
        });

    DependencyGraph g;
    for (auto& m : packages) {
        std::string name = m.package.name;
        g.index_[name] = g.graph_.add_node(std::move(m));
    }

    // 2. Every internal dependency resolves to a package
    for (NodeId id = 0; id < g.graph_.node_count(); ++id) {
        const auto& m = g.graph_.node(id);
        for (const auto& dep : m.internal_deps) {
            auto it = g.index_.find(dep);
            if (it == g.index_.end()) {
                return KaplaError{KaplaError::UnknownDependency,
                    "package '" + m.package.name +
                    "' depends on unknown package '" + dep + "'",
                    "add '" + dep + "' to the workspace members or remove "
                    "{ member = true } from the dependency"}
                    .with_subjects({m.package.name, dep});
            }
            g.graph_.add_edge(id, it->second);
        }
    }

    // 3. No cycles; report the full path
    auto cycle = g.graph_.find_cycle();
    if (!cycle.empty()) {
        auto names = g.to_names(cycle);
        std::string path;
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) path += " -> ";
            path += names[i];
        }
        names.pop_back();
        return KaplaError{KaplaError::Cycle,
            "dependency cycle detected: " + path,
            "break the cycle by removing one of the member dependencies"}
            .with_subjects(std::move(names));
    }

    // 4. Deterministic order
    auto order = g.graph_.topological_sort();
    if (order.is_err()) return std::move(order).error();
    g.order_ = g.to_names(order.value());

    log::debug("dependency graph: %zu packages", g.size());
    return Result<DependencyGraph>::ok(std::move(g));
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool DependencyGraph::contains(const std::string& name) const {
    return index_.count(name) > 0;
}

const Manifest* DependencyGraph::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &graph_.node(it->second);
}

std::vector<std::string> DependencyGraph::names() const {
    std::vector<std::string> out;
    out.reserve(size());
    for (NodeId id = 0; id < graph_.node_count(); ++id) {
        out.push_back(graph_.node(id).package.name);
    }
    return out;
}

std::vector<std::string> DependencyGraph::to_names(const std::vector<NodeId>& ids) const {
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (NodeId id : ids) out.push_back(graph_.node(id).package.name);
    return out;
}

ExecutionPlan DependencyGraph::plan() const {
    std::vector<bool> active(size(), true);
    ExecutionPlan p;
    // The graph was checked for cycles in build(), levels() cannot fail here
    auto levels = graph_.levels(active);
    for (const auto& level : levels.value()) {
        p.batches.push_back(to_names(level));
    }
    return p;
}

Result<ExecutionPlan> DependencyGraph::plan(const std::set<std::string>& selected) const {
    std::vector<bool> active(size(), false);
    for (const auto& name : selected) {
        auto it = index_.find(name);
        if (it == index_.end()) {
            return KaplaError{KaplaError::NotFound,
                "no package named '" + name + "'"}.with_subjects({name});
        }
        active[it->second] = true;
    }

    auto levels = graph_.levels(active);
    if (levels.is_err()) return std::move(levels).error();

    ExecutionPlan p;
    for (const auto& level : levels.value()) {
        p.batches.push_back(to_names(level));
    }
    return Result<ExecutionPlan>::ok(std::move(p));
}

std::vector<std::string> DependencyGraph::dependencies(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return {};
    auto ids = graph_.successors(it->second);
    std::sort(ids.begin(), ids.end());
    return to_names(ids);
}

std::vector<std::string> DependencyGraph::dependents(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return {};
    auto ids = graph_.predecessors(it->second);
    std::sort(ids.begin(), ids.end());
    return to_names(ids);
}

std::set<std::string> DependencyGraph::transitive_dependencies(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return {};
    auto names = to_names(graph_.reachable_from(it->second));
    return std::set<std::string>(names.begin(), names.end());
}

std::set<std::string> DependencyGraph::transitive_dependents(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return {};
    auto names = to_names(graph_.reaching(it->second));
    return std::set<std::string>(names.begin(), names.end());
}

std::string DependencyGraph::tree_display(const std::string& root) const {
    auto it = index_.find(root);
    if (it == index_.end()) return "";
    return graph_.tree_display(it->second, [](const Manifest& m) {
        return m.package.name + " v" + m.package.version;
    });
}

} // namespace kapla
