#pragma once

#include <kapla/result.hpp>
#include <kapla/dep_graph.hpp>
#include <string>
#include <set>

namespace kapla {

// Compute the packages targeted by one run.
//
// - include empty: every package in the graph, minus each excluded
//   package and everything depending on it
// - otherwise: include plus the transitive closure of internal deps; an
//   excluded package that a selected package needs fails with a
//   Selection error naming both
// - an unknown include name fails with NotFound, an unknown exclude name
//   is ignored with a warning
//
// The result is closed under internal dependencies.
Result<std::set<std::string>> select_packages(const DependencyGraph& graph,
                                              const std::set<std::string>& include,
                                              const std::set<std::string>& exclude);

} // namespace kapla
