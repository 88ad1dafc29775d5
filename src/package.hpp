#pragma once

#include "version.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

struct DependencySpec {
    std::string id;
    VersionRange range;
};

// Dependencies that apply to one target framework, or to every framework
// when target_framework is empty.
struct DependencySet {
    std::optional<std::string> target_framework;
    std::vector<DependencySpec> dependencies;
};

struct PackageRef {
    std::string id;
    Version version;
    std::string title;
    bool prerelease = false;
    bool latest_release = false;
    std::string download_url;
    std::string sha256;
    std::vector<DependencySet> dependency_sets;

    // "<id> <version>"
    std::string full_name() const;
};

// Packages selected for download, unique by (id, version), in discovery order.
// Ids compare case-insensitively and versions by value.
class ResolvedSet {
public:
    // Returns false and leaves the set untouched if (id, version) is already present.
    bool add(const PackageRef& pkg);
    bool contains(const PackageRef& pkg) const;
    bool contains(const std::string& id, const Version& version) const;

    const std::vector<PackageRef>& packages() const { return packages_; }
    size_t size() const { return packages_.size(); }
    bool empty() const { return packages_.empty(); }

    auto begin() const { return packages_.begin(); }
    auto end() const { return packages_.end(); }

private:
    std::vector<PackageRef> packages_;
    std::set<std::pair<std::string, Version>> keys_;
};
