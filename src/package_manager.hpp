#pragma once

#include "package_downloader.hpp"
#include "repository.hpp"
#include "run_context.hpp"

#include <filesystem>
#include <set>
#include <string>

struct PackageRequest {
    std::string id;
    std::string version; // empty resolves the latest release
    bool include_prerelease = false;
    std::filesystem::path download_dir = "download";
    std::set<std::string> target_frameworks; // empty accepts every framework
};

enum class RunOutcome {
    Done,
    Stopped,
    Failed
};

// Resolves the request's package and its dependency closure against index
// and downloads the archives. Resolution failures of the root are reported
// through ctx and yield RunOutcome::Failed; transport errors propagate.
RunOutcome process_package(const PackageRequest& request, PackageIndex& index, const RunContext& ctx, const FetchFunction& fetch);
