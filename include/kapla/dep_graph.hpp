#pragma once

#include <kapla/result.hpp>
#include <kapla/graph.hpp>
#include <kapla/manifest.hpp>
#include <string>
#include <vector>
#include <set>
#include <unordered_map>

namespace kapla {

// Ordered batches of package names. Batch i only holds packages whose
// selected internal dependencies sit in batches 0..i-1; names inside a
// batch are sorted.
struct ExecutionPlan {
    std::vector<std::vector<std::string>> batches;

    size_t package_count() const;
    std::vector<std::string> flatten() const;
};

// Validated, acyclic dependency graph over the members of one workspace.
// Rebuilt on every invocation; immutable once built.
class DependencyGraph {
public:
    // Fails with Duplicate, UnknownDependency or Cycle. No partial graph is
    // ever returned.
    static Result<DependencyGraph> build(std::vector<Manifest> packages);

    size_t size() const { return graph_.node_count(); }
    bool contains(const std::string& name) const;

    // nullptr when unknown
    const Manifest* find(const std::string& name) const;

    // All package names, sorted
    std::vector<std::string> names() const;

    // Dependencies before dependents; ties broken by name
    const std::vector<std::string>& topological_order() const { return order_; }

    ExecutionPlan plan() const;
    // Selected names must all be known, otherwise NotFound
    Result<ExecutionPlan> plan(const std::set<std::string>& selected) const;

    // Direct internal dependencies / dependents, sorted
    std::vector<std::string> dependencies(const std::string& name) const;
    std::vector<std::string> dependents(const std::string& name) const;

    std::set<std::string> transitive_dependencies(const std::string& name) const;
    std::set<std::string> transitive_dependents(const std::string& name) const;

    std::string tree_display(const std::string& root) const;

private:
    using NodeId = Graph<Manifest>::NodeId;

    Graph<Manifest> graph_;
    std::unordered_map<std::string, NodeId> index_;
    std::vector<std::string> order_;

    std::vector<std::string> to_names(const std::vector<NodeId>& ids) const;
};

} // namespace kapla
