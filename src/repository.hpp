#pragma once

#include "downloader.hpp"
#include "package.hpp"

#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Source of candidate records for a package id.
class PackageIndex {
public:
    virtual ~PackageIndex() = default;
    virtual std::vector<PackageRef> find_packages_by_id(const std::string& id) = 0;
};

// Text index: one "id|version|title|flags|download_url|sha256|dependency_sets"
// line per package version, served from a local directory or a remote mirror.
class Repository : public PackageIndex {
public:
    Repository();
    // Remote indexes are transferred with fetch.
    explicit Repository(FetchFunction fetch);

    // Loads <index_url>/index.txt. index_url must end with '/'. A remote
    // index is staged in the temp dir, which is removed again afterwards.
    void load_index(const std::string& index_url);
    // Relative download locations in the index are joined to base_url.
    void parse_index(std::istream& in, const std::string& base_url);

    std::vector<PackageRef> find_packages_by_id(const std::string& id) override;
    size_t size() const;

private:
    void read_index_file(const fs::path& index_path, const std::string& base_url);

    FetchFunction fetch_;
    std::unordered_map<std::string, std::vector<PackageRef>> packages_; // lowercased id -> versions
};

std::optional<std::vector<DependencySet>> parse_dependency_sets(std::string_view text);
