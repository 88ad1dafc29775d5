#pragma once

#include "package.hpp"
#include "resolver.hpp"
#include "run_context.hpp"

#include <set>
#include <string>
#include <vector>

struct GraphOptions {
    bool include_prerelease = false;
    // Accepted target-framework identifiers; empty accepts every framework.
    std::set<std::string> target_frameworks;
};

// Dependency specs of pkg that apply under the accepted frameworks, in declaration order.
std::vector<DependencySpec> applicable_dependencies(const PackageRef& pkg, const std::set<std::string>& target_frameworks);

// Expands root into its dependency closure, depth-first and pre-order. The root
// comes first in the returned set. A dependency that resolves to nothing is
// reported and skipped together with its subtree. When ctx requests a stop
// the partially populated set is returned as is.
ResolvedSet build_dependency_graph(const PackageRef& root, VersionResolver& resolver, const GraphOptions& options, const RunContext& ctx);
