#pragma once

#include <kapla/result.hpp>
#include <string>
#include <vector>
#include <queue>
#include <algorithm>
#include <functional>
#include <sstream>

namespace kapla {

// ---------------------------------------------------------------------------
// Graph<NodeData>: arena-backed directed graph
//
// Nodes live in a vector and are addressed by stable indices; an edge
// from -> to means "from depends on to". Node ids double as the
// scheduling priority: among equally ready nodes the smaller id wins.
// ---------------------------------------------------------------------------

template<typename NodeData>
class Graph {
public:
    using NodeId = size_t;

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        radj_.push_back({});
        return id;
    }

    void add_edge(NodeId from, NodeId to) {
        adj_[from].push_back(to);
        radj_[to].push_back(from);
    }

    bool has_edge(NodeId from, NodeId to) const {
        for (NodeId t : adj_[from]) {
            if (t == to) return true;
        }
        return false;
    }

    size_t node_count() const { return nodes_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }

    // Nodes `id` depends on
    const std::vector<NodeId>& successors(NodeId id) const { return adj_[id]; }
    // Nodes depending on `id`
    const std::vector<NodeId>& predecessors(NodeId id) const { return radj_[id]; }

    // Depth-first search with an in-progress marker per node. Returns the
    // first cycle met, as a closed path [n0, n1, ..., n0], or an empty
    // vector when the graph is acyclic. Roots are tried in id order.
    std::vector<NodeId> find_cycle() const {
        std::vector<Mark> marks(nodes_.size(), Mark::Unvisited);
        std::vector<NodeId> stack;
        std::vector<NodeId> cycle;
        for (NodeId root = 0; root < nodes_.size() && cycle.empty(); ++root) {
            if (marks[root] == Mark::Unvisited) {
                find_cycle_impl(root, marks, stack, cycle);
            }
        }
        return cycle;
    }

    // Kahn's algorithm over reversed edges: a node is emitted once every
    // node it depends on has been emitted. Ties go to the smallest id.
    Result<std::vector<NodeId>> topological_sort() const {
        size_t n = nodes_.size();
        std::vector<size_t> remaining(n);
        std::priority_queue<NodeId, std::vector<NodeId>, std::greater<NodeId>> ready;
        for (NodeId i = 0; i < n; ++i) {
            remaining[i] = adj_[i].size();
            if (remaining[i] == 0) ready.push(i);
        }

        std::vector<NodeId> order;
        order.reserve(n);
        while (!ready.empty()) {
            NodeId u = ready.top();
            ready.pop();
            order.push_back(u);
            for (NodeId dependent : radj_[u]) {
                if (--remaining[dependent] == 0) ready.push(dependent);
            }
        }

        if (order.size() != n) {
            return KaplaError{KaplaError::Cycle, "graph contains a cycle"};
        }
        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

    // Group the nodes selected by `active` into dependency levels: level i
    // holds the nodes whose active dependencies all sit in levels < i.
    // Inactive dependencies count as already satisfied. Each level is
    // sorted by id.
    Result<std::vector<std::vector<NodeId>>> levels(
        const std::vector<bool>& active) const
    {
        size_t n = nodes_.size();
        std::vector<size_t> remaining(n, 0);
        std::vector<NodeId> current;
        size_t active_count = 0;
        for (NodeId i = 0; i < n; ++i) {
            if (!active[i]) continue;
            ++active_count;
            for (NodeId dep : adj_[i]) {
                if (active[dep]) ++remaining[i];
            }
            if (remaining[i] == 0) current.push_back(i);
        }

        std::vector<std::vector<NodeId>> result;
        size_t emitted = 0;
        while (!current.empty()) {
            std::vector<NodeId> next;
            for (NodeId u : current) {
                for (NodeId dependent : radj_[u]) {
                    if (active[dependent] && --remaining[dependent] == 0) {
                        next.push_back(dependent);
                    }
                }
            }
            emitted += current.size();
            result.push_back(std::move(current));
            std::sort(next.begin(), next.end());
            current = std::move(next);
        }

        if (emitted != active_count) {
            return KaplaError{KaplaError::Cycle,
                "graph contains a cycle in the selected subgraph"};
        }
        return Result<std::vector<std::vector<NodeId>>>::ok(std::move(result));
    }

    // Nodes reachable from `start` through successor edges, excluding start
    std::vector<NodeId> reachable_from(NodeId start) const {
        return reach(start, adj_);
    }

    // Nodes that reach `start`, excluding start
    std::vector<NodeId> reaching(NodeId start) const {
        return reach(start, radj_);
    }

    // Tree display: format the dependency tree as a string.
    // to_string_fn converts NodeData to a display string.
    std::string tree_display(
        NodeId root,
        std::function<std::string(const NodeData&)> to_string_fn) const
    {
        std::ostringstream out;
        std::vector<bool> visited(nodes_.size(), false);
        tree_display_impl(root, "", true, visited, to_string_fn, out);
        return out.str();
    }

private:
    enum class Mark { Unvisited, InProgress, Done };

    std::vector<NodeData> nodes_;
    std::vector<std::vector<NodeId>> adj_;
    std::vector<std::vector<NodeId>> radj_;

    bool find_cycle_impl(NodeId u, std::vector<Mark>& marks,
                         std::vector<NodeId>& stack,
                         std::vector<NodeId>& cycle) const {
        marks[u] = Mark::InProgress;
        stack.push_back(u);
        for (NodeId v : adj_[u]) {
            if (marks[v] == Mark::InProgress) {
                auto it = std::find(stack.begin(), stack.end(), v);
                cycle.assign(it, stack.end());
                cycle.push_back(v);
                return true;
            }
            if (marks[v] == Mark::Unvisited &&
                find_cycle_impl(v, marks, stack, cycle)) {
                return true;
            }
        }
        stack.pop_back();
        marks[u] = Mark::Done;
        return false;
    }

    std::vector<NodeId> reach(NodeId start,
                              const std::vector<std::vector<NodeId>>& edges) const {
        std::vector<bool> seen(nodes_.size(), false);
        std::vector<NodeId> out;
        std::vector<NodeId> todo{start};
        seen[start] = true;
        while (!todo.empty()) {
            NodeId u = todo.back();
            todo.pop_back();
            for (NodeId v : edges[u]) {
                if (!seen[v]) {
                    seen[v] = true;
                    out.push_back(v);
                    todo.push_back(v);
                }
            }
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    void tree_display_impl(
        NodeId u,
        const std::string& prefix,
        bool is_last,
        std::vector<bool>& visited,
        std::function<std::string(const NodeData&)>& to_string_fn,
        std::ostringstream& out) const
    {
        out << prefix;
        if (!prefix.empty()) {
            out << (is_last ? "└── " : "├── ");
        }
        out << to_string_fn(nodes_[u]);

        if (visited[u]) {
            out << " (*)\n";
            return;
        }
        visited[u] = true;
        out << "\n";

        const auto& edges = adj_[u];
        for (size_t i = 0; i < edges.size(); ++i) {
            std::string child_prefix = prefix;
            if (!prefix.empty()) {
                child_prefix += (is_last ? "    " : "│   ");
            } else {
                child_prefix = " ";
            }
            tree_display_impl(edges[i], child_prefix,
                              i == edges.size() - 1,
                              visited, to_string_fn, out);
        }
    }
};

} // namespace kapla
