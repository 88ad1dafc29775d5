#include "package_manager.hpp"

#include "dependency_graph.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "resolver.hpp"

namespace {

RunOutcome report_stopped(const RunContext& ctx) {
    ctx.report(get_string("progress.stopped"));
    return RunOutcome::Stopped;
}

} // anonymous namespace

RunOutcome process_package(const PackageRequest& request, PackageIndex& index, const RunContext& ctx, const FetchFunction& fetch) {
    if (ctx.should_stop()) return report_stopped(ctx);

    VersionResolver resolver(index);
    PackageRef root;
    try {
        root = request.version.empty()
            ? resolver.resolve_latest(request.id, request.include_prerelease)
            : resolver.resolve_exact(request.id, request.version);
    } catch (const InvalidVersionError&) {
        ctx.report(get_string("progress.invalid_version"));
        return RunOutcome::Failed;
    } catch (const PackageNotFoundError&) {
        ctx.report(get_string("progress.package_not_found"));
        return RunOutcome::Failed;
    }
    ctx.report(root.full_name());

    const GraphOptions options{
        .include_prerelease = request.include_prerelease,
        .target_frameworks = request.target_frameworks
    };
    const ResolvedSet packages = build_dependency_graph(root, resolver, options, ctx);

    if (ctx.should_stop()) return report_stopped(ctx);

    ctx.report(string_format("progress.packages_to_download", packages.size()));

    const DownloadSummary summary = download_packages(request.download_dir, packages, ctx, fetch);
    if (summary.stopped || ctx.should_stop()) return report_stopped(ctx);

    ctx.report(get_string("progress.done"));
    return RunOutcome::Done;
}
