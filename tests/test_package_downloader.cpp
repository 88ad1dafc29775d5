#include <gtest/gtest.h>
#include "package_downloader.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "fake_index.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class PackageDownloaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization(NUDL_TEST_L10N_DIR, "en");
        suite_work_dir = fs::absolute("tmp_downloader_test");
        fs::remove_all(suite_work_dir);
        source_dir = suite_work_dir / "source";
        download_dir = suite_work_dir / "download" / "nested";
        fs::create_directories(source_dir);
        ctx.progress = [this](const std::string& msg) { messages.push_back(msg); };
    }

    void TearDown() override {
        fs::remove_all(suite_work_dir);
    }

    // Adds a package whose archive lives in source_dir and is served over file://
    PackageRef make_package(const std::string& id, const std::string& version, const std::string& content) {
        PackageRef pkg = index.add(id, version, true);
        const fs::path archive = source_dir / (id + "-" + version + ".bin");
        std::ofstream(archive, std::ios::binary) << content;
        pkg.download_url = "file://" + archive.string();
        return pkg;
    }

    std::set<std::string> files_in(const fs::path& dir) {
        std::set<std::string> out;
        for (const auto& entry : fs::directory_iterator(dir)) out.insert(entry.path().filename().string());
        return out;
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    }

    FetchFunction counting_fetch() {
        return [this](const std::string& url, const fs::path& output_path) {
            ++fetches;
            download_file(url, output_path, false);
        };
    }

    fs::path suite_work_dir;
    fs::path source_dir;
    fs::path download_dir;
    FakeIndex index;
    RunContext ctx;
    std::vector<std::string> messages;
    int fetches = 0;
};

TEST_F(PackageDownloaderTest, ArchiveFileName) {
    PackageRef pkg = index.add("Newtonsoft.Json", "13.0.1");
    EXPECT_EQ(archive_file_name(pkg), "Newtonsoft.Json.13.0.1.nupkg");
}

TEST_F(PackageDownloaderTest, DownloadsInDiscoveryOrder) {
    ResolvedSet set;
    set.add(make_package("B", "2.0", "bbb"));
    set.add(make_package("A", "1.0", "aaa"));

    auto summary = download_packages(download_dir, set, ctx, counting_fetch());
    EXPECT_EQ(summary.downloaded, 2u);
    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_FALSE(summary.stopped);
    EXPECT_EQ(fetches, 2);

    EXPECT_EQ(messages, (std::vector<std::string>{"downloading B 2.0", "downloading A 1.0"}));
    EXPECT_EQ(read_file(download_dir / "B.2.0.nupkg"), "bbb");
    EXPECT_EQ(read_file(download_dir / "A.1.0.nupkg"), "aaa");
}

TEST_F(PackageDownloaderTest, SecondPassTransfersNothing) {
    ResolvedSet set;
    set.add(make_package("A", "1.0", "aaa"));
    set.add(make_package("B", "2.0", "bbb"));

    download_packages(download_dir, set, ctx, counting_fetch());
    const auto files_after_first = files_in(download_dir);
    ASSERT_EQ(fetches, 2);

    messages.clear();
    auto summary = download_packages(download_dir, set, ctx, counting_fetch());
    EXPECT_EQ(fetches, 2);
    EXPECT_EQ(summary.downloaded, 0u);
    EXPECT_EQ(summary.skipped, 2u);
    EXPECT_EQ(files_in(download_dir), files_after_first);
    EXPECT_EQ(messages, (std::vector<std::string>{
        (download_dir / "A.1.0.nupkg").string() + " already downloaded.",
        (download_dir / "B.2.0.nupkg").string() + " already downloaded."}));
}

TEST_F(PackageDownloaderTest, StopBeforeEachDownload) {
    ResolvedSet set;
    set.add(make_package("A", "1.0", "aaa"));
    set.add(make_package("B", "1.0", "bbb"));
    set.add(make_package("C", "1.0", "ccc"));

    int polls = 0;
    ctx.stop_requested = [&polls]() { return ++polls > 1; };

    auto summary = download_packages(download_dir, set, ctx, counting_fetch());
    EXPECT_TRUE(summary.stopped);
    EXPECT_EQ(summary.downloaded, 1u);
    EXPECT_EQ(files_in(download_dir), (std::set<std::string>{"A.1.0.nupkg"}));
}

TEST_F(PackageDownloaderTest, CreatesDirectoryEvenWhenEmpty) {
    ResolvedSet empty;
    auto summary = download_packages(download_dir, empty, ctx, counting_fetch());
    EXPECT_TRUE(fs::is_directory(download_dir));
    EXPECT_EQ(summary.downloaded, 0u);
}

TEST_F(PackageDownloaderTest, TransportFailurePropagatesAndLeavesNoPartialFile) {
    ResolvedSet set;
    set.add(make_package("A", "1.0", "aaa"));
    PackageRef broken = index.add("Broken", "1.0", true);
    broken.download_url = "file://" + (source_dir / "does-not-exist.bin").string();
    set.add(broken);
    set.add(make_package("C", "1.0", "ccc"));

    EXPECT_THROW(download_packages(download_dir, set, ctx, counting_fetch()), TransportError);
    EXPECT_EQ(files_in(download_dir), (std::set<std::string>{"A.1.0.nupkg"}));

    // A rerun after the source is fixed resumes with the remaining packages.
    std::ofstream(source_dir / "does-not-exist.bin") << "fixed";
    fetches = 0;
    auto summary = download_packages(download_dir, set, ctx, counting_fetch());
    EXPECT_EQ(fetches, 2);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(files_in(download_dir), (std::set<std::string>{"A.1.0.nupkg", "Broken.1.0.nupkg", "C.1.0.nupkg"}));
}

TEST_F(PackageDownloaderTest, VerifiesDigestWhenKnown) {
    PackageRef good = make_package("Good", "1.0", "abc");
    good.sha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    PackageRef bad = make_package("Bad", "1.0", "abd");
    bad.sha256 = good.sha256;

    ResolvedSet set;
    set.add(good);
    set.add(bad);

    EXPECT_THROW(download_packages(download_dir, set, ctx, counting_fetch()), NudlException);
    EXPECT_EQ(files_in(download_dir), (std::set<std::string>{"Good.1.0.nupkg"}));
}
