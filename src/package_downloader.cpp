#include "package_downloader.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

std::string archive_file_name(const PackageRef& pkg) {
    return pkg.id + "." + pkg.version.to_string() + "." + std::string(ARCHIVE_EXTENSION);
}

DownloadSummary download_packages(const fs::path& download_dir, const ResolvedSet& packages, const RunContext& ctx, const FetchFunction& fetch) {
    ensure_dir_exists(download_dir);

    DownloadSummary summary;
    for (const auto& pkg : packages) {
        if (ctx.should_stop()) {
            summary.stopped = true;
            return summary;
        }

        const fs::path file_name = download_dir / archive_file_name(pkg);
        if (fs::exists(file_name)) {
            ctx.report(string_format("progress.already_downloaded", file_name.string()));
            ++summary.skipped;
            continue;
        }

        ctx.report(string_format("progress.downloading", pkg.id, pkg.version.to_string()));
        try {
            fetch(pkg.download_url, file_name);
        } catch (const TransportError&) {
            std::error_code ec;
            fs::remove(file_name, ec);
            throw;
        }

        if (!pkg.sha256.empty() && !sha256_matches(file_name, pkg.sha256)) {
            std::error_code ec;
            fs::remove(file_name, ec);
            throw NudlException(string_format("error.hash_mismatch", pkg.full_name()));
        }
        ++summary.downloaded;
    }
    return summary;
}
