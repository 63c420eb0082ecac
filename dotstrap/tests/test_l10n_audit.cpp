#include <gtest/gtest.h>
#include "localization.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <regex>
#include <set>
#include <unistd.h>

namespace fs = std::filesystem;

class L10nIntegrityTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }

    std::set<std::string> extract_keys_from_source(const fs::path& src_dir) {
        std::set<std::string> keys;
        std::regex key_regex("(?:get_string|log_info|log_error|log_warning|string_format)\\s*\\(\\s*\"([^\"]+)\"");
        std::regex catalog_key("^[a-z_]+\\.[a-z_]+$");

        for (auto const& dir_entry : fs::recursive_directory_iterator(src_dir)) {
            if (dir_entry.is_regular_file() && (dir_entry.path().extension() == ".cpp" || dir_entry.path().extension() == ".hpp")) {
                std::ifstream f(dir_entry.path());
                std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
                auto words_begin = std::sregex_iterator(content.begin(), content.end(), key_regex);
                auto words_end = std::sregex_iterator();
                for (std::sregex_iterator i = words_begin; i != words_end; ++i) {
                    std::string key = (*i)[1].str();
                    // Literal log messages are not catalog keys
                    if (std::regex_match(key, catalog_key)) {
                        keys.insert(key);
                    }
                }
            }
        }
        return keys;
    }

    static std::map<std::string, std::string> read_catalog(const fs::path& file) {
        std::map<std::string, std::string> entries;
        std::ifstream in(file);
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty() || line[0] == '#') continue;
            auto pos = line.find('=');
            if (pos != std::string::npos) {
                entries[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
        return entries;
    }
};

TEST_F(L10nIntegrityTest, AllSourceKeysExistInTranslations) {
    const fs::path source_root = DOTSTRAP_SOURCE_DIR;
    auto source_keys = extract_keys_from_source(source_root / "src");
    ASSERT_FALSE(source_keys.empty());

    std::vector<std::string> missing_keys;
    for (const auto& key : source_keys) {
        std::string val = get_string(key);
        if (val.find("[MISSING_STRING:") != std::string::npos) {
            missing_keys.push_back(key);
        }
    }

    std::string error_msg = "The following keys are missing in localization files: ";
    for (const auto& k : missing_keys) error_msg += k + ", ";

    EXPECT_TRUE(missing_keys.empty()) << error_msg;
}

TEST_F(L10nIntegrityTest, CatalogsDeclareTheSameKeys) {
    const fs::path l10n_dir = fs::path(DOTSTRAP_SOURCE_DIR) / "l10n";
    auto en = read_catalog(l10n_dir / "en.txt");
    auto zh = read_catalog(l10n_dir / "zh.txt");
    ASSERT_FALSE(en.empty());

    std::vector<std::string> only_en, only_zh;
    for (const auto& [key, value] : en) {
        if (!zh.contains(key)) only_en.push_back(key);
    }
    for (const auto& [key, value] : zh) {
        if (!en.contains(key)) only_zh.push_back(key);
    }
    EXPECT_TRUE(only_en.empty()) << "missing from zh.txt: " << ::testing::PrintToString(only_en);
    EXPECT_TRUE(only_zh.empty()) << "missing from en.txt: " << ::testing::PrintToString(only_zh);
}

TEST_F(L10nIntegrityTest, ExecutableDirFallsBackToCurrentDirectoryWithWarning) {
    const fs::path missing_link = fs::temp_directory_path() / ("dotstrap_no_exe_" + std::to_string(::getpid()));
    fs::remove(missing_link);

    ::testing::internal::CaptureStderr();
    const fs::path dir = executable_dir(missing_link);
    const std::string warning = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(dir, fs::current_path());
    EXPECT_NE(warning.find("Could not determine executable path via " + missing_link.string()), std::string::npos);
    EXPECT_NE(warning.find(get_string("warning.prefix")), std::string::npos);
}

TEST_F(L10nIntegrityTest, ExecutableDirResolvesTheRunningBinary) {
    ::testing::internal::CaptureStderr();
    const fs::path dir = executable_dir();
    EXPECT_TRUE(::testing::internal::GetCapturedStderr().empty());
    EXPECT_TRUE(fs::is_directory(dir));
}
