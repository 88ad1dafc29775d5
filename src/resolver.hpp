#pragma once

#include "package.hpp"
#include "repository.hpp"

#include <optional>
#include <string>
#include <vector>

// Candidate-list selection. Highest version wins in every case.
std::optional<PackageRef> select_latest(const std::vector<PackageRef>& candidates, bool include_prerelease);
std::optional<PackageRef> select_exact(const std::vector<PackageRef>& candidates, const Version& version);
std::optional<PackageRef> select_in_range(const std::vector<PackageRef>& candidates, const VersionRange& range, bool include_prerelease);

// Picks one concrete version of a package from the index. Every operation
// throws PackageNotFoundError when no candidate survives.
class VersionResolver {
public:
    explicit VersionResolver(PackageIndex& index) : index_(index) {}

    PackageRef resolve_latest(const std::string& id, bool include_prerelease);
    // Throws InvalidVersionError if version_string does not parse. The
    // prerelease switch does not apply to an explicitly requested version.
    PackageRef resolve_exact(const std::string& id, const std::string& version_string);
    PackageRef resolve_in_range(const std::string& id, const VersionRange& range, bool include_prerelease);

private:
    PackageIndex& index_;
};
