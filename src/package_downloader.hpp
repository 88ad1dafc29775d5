#pragma once

#include "downloader.hpp"
#include "package.hpp"
#include "run_context.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;


struct DownloadSummary {
    size_t downloaded = 0;
    size_t skipped = 0;
    bool stopped = false;
};

// "<id>.<version>.nupkg"
std::string archive_file_name(const PackageRef& pkg);

// Fetches every package of the set into download_dir, in discovery order.
// Archives already present are skipped, so a rerun resumes where an earlier
// run stopped. Transport errors propagate.
DownloadSummary download_packages(const fs::path& download_dir, const ResolvedSet& packages, const RunContext& ctx, const FetchFunction& fetch);
