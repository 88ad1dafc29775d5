#include "dependency_graph.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>

namespace {

// One package whose dependencies are being walked.
struct Frame {
    PackageRef package;
    std::vector<DependencySpec> dependencies;
    size_t next = 0;
};

bool framework_accepted(const std::optional<std::string>& framework, const std::set<std::string>& target_frameworks) {
    if (!framework || target_frameworks.empty()) return true;
    return std::ranges::any_of(target_frameworks, [&](const std::string& accepted) {
        return iequals(accepted, *framework);
    });
}

} // anonymous namespace

std::vector<DependencySpec> applicable_dependencies(const PackageRef& pkg, const std::set<std::string>& target_frameworks) {
    std::vector<DependencySpec> deps;
    for (const auto& set : pkg.dependency_sets) {
        if (!framework_accepted(set.target_framework, target_frameworks)) continue;
        deps.insert(deps.end(), set.dependencies.begin(), set.dependencies.end());
    }
    return deps;
}

ResolvedSet build_dependency_graph(const PackageRef& root, VersionResolver& resolver, const GraphOptions& options, const RunContext& ctx) {
    ResolvedSet resolved;
    resolved.add(root);

    // The top frame is the package currently being expanded; pushing a child
    // before moving on to the next sibling reproduces recursive pre-order.
    std::vector<Frame> stack;
    stack.push_back(Frame{root, applicable_dependencies(root, options.target_frameworks)});

    while (!stack.empty()) {
        Frame& frame = stack.back();
        if (frame.next >= frame.dependencies.size()) {
            stack.pop_back();
            continue;
        }

        if (ctx.should_stop()) {
            return resolved;
        }

        const DependencySpec& dep = frame.dependencies[frame.next++];
        PackageRef child;
        try {
            child = resolver.resolve_in_range(dep.id, dep.range, options.include_prerelease);
        } catch (const PackageNotFoundError&) {
            ctx.report(string_format("warning.dependency_skipped", frame.package.full_name(), dep.id, dep.range.to_string()));
            continue;
        }

        ctx.report(string_format("progress.edge", frame.package.full_name(), child.full_name()));

        if (resolved.add(child)) {
            // frame is invalidated by the push below
            auto child_deps = applicable_dependencies(child, options.target_frameworks);
            stack.push_back(Frame{std::move(child), std::move(child_deps)});
        }
    }
    return resolved;
}
