#include "resolver.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <ranges>

namespace {

template<typename Pred>
std::optional<PackageRef> highest_matching(const std::vector<PackageRef>& candidates, Pred&& pred) {
    const PackageRef* best = nullptr;
    for (const auto& pkg : candidates | std::views::filter(pred)) {
        if (!best || pkg.version > best->version) best = &pkg;
    }
    if (!best) return std::nullopt;
    return *best;
}

} // anonymous namespace

std::optional<PackageRef> select_latest(const std::vector<PackageRef>& candidates, bool include_prerelease) {
    if (include_prerelease) {
        return highest_matching(candidates, [](const PackageRef&) { return true; });
    }
    return highest_matching(candidates, [](const PackageRef& pkg) {
        return !pkg.prerelease && pkg.latest_release;
    });
}

std::optional<PackageRef> select_exact(const std::vector<PackageRef>& candidates, const Version& version) {
    return highest_matching(candidates, [&](const PackageRef& pkg) { return pkg.version == version; });
}

std::optional<PackageRef> select_in_range(const std::vector<PackageRef>& candidates, const VersionRange& range, bool include_prerelease) {
    return highest_matching(candidates, [&](const PackageRef& pkg) {
        return (include_prerelease || !pkg.prerelease) && range.satisfies(pkg.version);
    });
}

PackageRef VersionResolver::resolve_latest(const std::string& id, bool include_prerelease) {
    auto pkg = select_latest(index_.find_packages_by_id(id), include_prerelease);
    if (!pkg) {
        throw PackageNotFoundError(string_format("error.package_not_found", id));
    }
    return std::move(*pkg);
}

PackageRef VersionResolver::resolve_exact(const std::string& id, const std::string& version_string) {
    const auto version = Version::parse(version_string);
    if (!version) {
        throw InvalidVersionError(string_format("error.invalid_version", version_string));
    }
    auto pkg = select_exact(index_.find_packages_by_id(id), *version);
    if (!pkg) {
        throw PackageNotFoundError(string_format("error.package_version_not_found", id, version_string));
    }
    return std::move(*pkg);
}

PackageRef VersionResolver::resolve_in_range(const std::string& id, const VersionRange& range, bool include_prerelease) {
    auto pkg = select_in_range(index_.find_packages_by_id(id), range, include_prerelease);
    if (!pkg) {
        throw PackageNotFoundError(string_format("error.package_range_not_found", id, range.to_string()));
    }
    return std::move(*pkg);
}
