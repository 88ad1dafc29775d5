#include <gtest/gtest.h>
#include "localization.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <regex>
#include <set>
#include <vector>

namespace fs = std::filesystem;

class L10nIntegrityTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization(NUDL_TEST_L10N_DIR, "en");
    }

    std::set<std::string> extract_keys_from_source(const fs::path& src_dir) {
        std::set<std::string> keys;
        const std::regex key_regex("(?:get_string|string_format)\\s*\\(\\s*\"([^\"]+)\"");

        for (auto const& dir_entry : fs::recursive_directory_iterator(src_dir)) {
            if (dir_entry.is_regular_file() && (dir_entry.path().extension() == ".cpp" || dir_entry.path().extension() == ".hpp")) {
                std::ifstream f(dir_entry.path());
                std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
                auto words_begin = std::sregex_iterator(content.begin(), content.end(), key_regex);
                auto words_end = std::sregex_iterator();
                for (std::sregex_iterator i = words_begin; i != words_end; ++i) {
                    keys.insert((*i)[1].str());
                }
            }
        }
        return keys;
    }

    std::set<std::string> keys_in_table(const fs::path& table) {
        std::set<std::string> keys;
        std::ifstream f(table);
        std::string line;
        while (std::getline(f, line)) {
            if (line.empty() || line[0] == '#') continue;
            const size_t pos = line.find('=');
            if (pos != std::string::npos) keys.insert(line.substr(0, pos));
        }
        return keys;
    }
};

TEST_F(L10nIntegrityTest, AllSourceKeysExistInEveryTranslation) {
    const auto source_keys = extract_keys_from_source(NUDL_TEST_SOURCE_DIR);
    ASSERT_FALSE(source_keys.empty());

    for (const char* lang : {"en", "zh"}) {
        const auto table_keys = keys_in_table(fs::path(NUDL_TEST_L10N_DIR) / (std::string(lang) + ".txt"));
        ASSERT_FALSE(table_keys.empty()) << lang;

        std::string missing;
        for (const auto& key : source_keys) {
            if (!table_keys.contains(key)) missing += key + ", ";
        }
        EXPECT_TRUE(missing.empty()) << "Keys missing in " << lang << ".txt: " << missing;
    }
}

TEST_F(L10nIntegrityTest, TablesDefineTheSameKeys) {
    EXPECT_EQ(keys_in_table(fs::path(NUDL_TEST_L10N_DIR) / "en.txt"),
              keys_in_table(fs::path(NUDL_TEST_L10N_DIR) / "zh.txt"));
}

TEST_F(L10nIntegrityTest, ChineseTableLoads) {
    init_localization(NUDL_TEST_L10N_DIR, "zh");
    EXPECT_EQ(get_string("progress.done"), "完成。");
    EXPECT_EQ(get_string("info.log_prefix"), "==> ");
    init_localization(NUDL_TEST_L10N_DIR, "en");
}

TEST_F(L10nIntegrityTest, MissingLanguageFallsBackToEnglishWithPrefixedWarning) {
    const fs::path only_en = fs::absolute("tmp_l10n_fallback_test");
    fs::remove_all(only_en);
    fs::create_directories(only_en);
    fs::copy_file(fs::path(NUDL_TEST_L10N_DIR) / "en.txt", only_en / "en.txt");

    testing::internal::CaptureStderr();
    init_localization(only_en, "zh");
    const std::string err = testing::internal::GetCapturedStderr();
    fs::remove_all(only_en);

    EXPECT_EQ(err.find("[MISSING_STRING"), std::string::npos) << err;
    EXPECT_NE(err.find("WARNING: "), std::string::npos) << err;
    EXPECT_NE(err.find("zh"), std::string::npos) << err;
    EXPECT_EQ(get_string("progress.done"), "Done.");
}

TEST_F(L10nIntegrityTest, ProgressLinesMatchExpectedWording) {
    EXPECT_EQ(string_format("progress.edge", std::string("A 1.0"), std::string("B 2.0")), "A 1.0 -> B 2.0");
    EXPECT_EQ(string_format("progress.downloading", std::string("A"), std::string("1.0")), "downloading A 1.0");
    EXPECT_EQ(string_format("progress.already_downloaded", std::string("d/A.1.0.nupkg")), "d/A.1.0.nupkg already downloaded.");
    EXPECT_EQ(get_string("progress.done"), "Done.");
    EXPECT_EQ(get_string("progress.stopped"), "Stopped.");
}
