#include "package.hpp"
#include "utils.hpp"

std::string PackageRef::full_name() const {
    return id + " " + version.to_string();
}

bool ResolvedSet::add(const PackageRef& pkg) {
    if (!keys_.emplace(to_lower(pkg.id), pkg.version).second) {
        return false;
    }
    packages_.push_back(pkg);
    return true;
}

bool ResolvedSet::contains(const PackageRef& pkg) const {
    return contains(pkg.id, pkg.version);
}

bool ResolvedSet::contains(const std::string& id, const Version& version) const {
    return keys_.contains({to_lower(id), version});
}
