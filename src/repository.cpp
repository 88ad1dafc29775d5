#include "repository.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "utils.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include <sstream>
#include <fstream>
#include <string_view>

namespace {

bool is_remote_url(std::string_view url) {
    return url.find("://") != std::string_view::npos && !url.starts_with("file://");
}

std::string local_index_dir(const std::string& index_url) {
    return index_url.starts_with("file://") ? index_url.substr(7) : index_url;
}

// Base URL that relative download locations are joined to.
std::string download_base(const std::string& index_url) {
    if (index_url.find("://") != std::string::npos) return index_url;
    std::string base = "file://" + fs::absolute(index_url).lexically_normal().string();
    if (base.back() != '/') base += '/';
    return base;
}

std::string resolve_download_url(std::string_view url, const std::string& base, const PackageRef& pkg) {
    if (url.empty()) {
        return base + pkg.id + "." + pkg.version.to_string() + "." + std::string(ARCHIVE_EXTENSION);
    }
    if (url.find("://") != std::string_view::npos) return std::string(url);
    if (url.front() == '/') return "file://" + std::string(url);
    return base + std::string(url);
}

// Removes the staging directory of a remote index on every exit path.
struct TmpDirGuard {
    fs::path dir;
    ~TmpDirGuard() {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            log_warning(string_format("warning.cleanup_tmp_failed", dir.string(), ec.message()));
        }
    }
};

} // anonymous namespace

std::optional<std::vector<DependencySet>> parse_dependency_sets(std::string_view text) {
    std::vector<DependencySet> sets;
    if (trim(text).empty()) return sets;

    for (const auto group_sv : split(text, ';')) {
        std::string group = trim(group_sv);
        DependencySet set;
        if (const auto colon = group.find(':'); colon != std::string::npos) {
            std::string framework = trim(std::string_view(group).substr(0, colon));
            if (framework.empty()) return std::nullopt;
            set.target_framework = std::move(framework);
            group = group.substr(colon + 1);
        }

        std::istringstream tokens(group);
        std::string token;
        while (tokens >> token) {
            DependencySpec dep;
            const auto at = token.find('@');
            dep.id = token.substr(0, at);
            if (dep.id.empty()) return std::nullopt;
            if (at != std::string::npos) {
                auto range = VersionRange::parse(std::string_view(token).substr(at + 1));
                if (!range) return std::nullopt;
                dep.range = std::move(*range);
            }
            set.dependencies.push_back(std::move(dep));
        }
        sets.push_back(std::move(set));
    }
    return sets;
}

Repository::Repository()
    : fetch_([](const std::string& url, const fs::path& output_path) { download_file(url, output_path, false); }) {}

Repository::Repository(FetchFunction fetch) : fetch_(std::move(fetch)) {}

void Repository::load_index(const std::string& index_url) {
    packages_.clear();

    if (!is_remote_url(index_url)) {
        const fs::path index_path = fs::path(local_index_dir(index_url)) / "index.txt";
        if (!fs::exists(index_path)) {
            throw NudlException(string_format("error.index_not_found", index_path.string()));
        }
        read_index_file(index_path, download_base(index_url));
        return;
    }

    TmpDirGuard staging{get_tmp_dir()};
    ensure_dir_exists(staging.dir);
    const fs::path index_path = staging.dir / "index.txt";
    fetch_(index_url + "index.txt", index_path);
    read_index_file(index_path, download_base(index_url));
}

void Repository::read_index_file(const fs::path& index_path, const std::string& base_url) {
    std::ifstream file(index_path);
    if (!file.is_open()) {
        throw NudlException(string_format("error.open_file_failed", index_path.string()));
    }
    parse_index(file, base_url);
}

void Repository::parse_index(std::istream& in, const std::string& base_url) {
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        std::string_view sv = line;
        if (!sv.empty() && sv.back() == '\r') sv.remove_suffix(1);
        if (const std::string text = trim(sv); text.empty() || text.front() == '#') continue;

        auto parts = split(sv, '|');
        auto field = [&](size_t i) { return i < parts.size() ? trim(parts[i]) : std::string(); };

        PackageRef pkg;
        pkg.id = field(0);
        auto version = Version::parse(field(1));
        if (pkg.id.empty() || !version) {
            log_warning(string_format("warning.index_line_skipped", line_no));
            continue;
        }
        pkg.version = std::move(*version);
        pkg.title = field(2).empty() ? pkg.id : field(2);

        const std::string flags = field(3);
        for (const auto flag : split(flags, ',')) {
            const std::string f = to_lower(trim(flag));
            if (f == "latest") pkg.latest_release = true;
            else if (f == "prerelease") pkg.prerelease = true;
        }
        if (pkg.version.is_prerelease()) pkg.prerelease = true;

        pkg.download_url = resolve_download_url(field(4), base_url, pkg);
        pkg.sha256 = to_lower(field(5));

        auto sets = parse_dependency_sets(field(6));
        if (!sets) {
            log_warning(string_format("warning.index_line_skipped", line_no));
            continue;
        }
        pkg.dependency_sets = std::move(*sets);

        packages_[to_lower(pkg.id)].push_back(std::move(pkg));
    }
}

std::vector<PackageRef> Repository::find_packages_by_id(const std::string& id) {
    auto it = packages_.find(to_lower(id));
    if (it == packages_.end()) return {};
    return it->second;
}

size_t Repository::size() const {
    size_t count = 0;
    for (const auto& [id, versions] : packages_) count += versions.size();
    return count;
}
