#include <gtest/gtest.h>
#include "registry.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
        test_root = fs::temp_directory_path() / ("dotstrap_registry_" + std::to_string(getpid()));
        fs::remove_all(test_root);
        fs::create_directories(test_root / "repo/scripts");
        fs::create_directories(test_root / "home");
        set_repo_root((test_root / "repo").string());
        set_home_dir((test_root / "home").string());
    }

    void TearDown() override {
        fs::remove_all(test_root);
    }

    void write_links(const std::string& content) {
        std::ofstream f(LINKS_FILE);
        f << content;
    }

    fs::path test_root;
};

TEST_F(RegistryTest, LoadsEntriesInDeclaredOrder) {
    write_links(R"({"links": [
        {"key": ".zshrc", "description": "Zsh config"},
        {"key": ".config/git", "description": "Git config"}
    ]})");

    auto entries = load_link_entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].key, ".zshrc");
    EXPECT_EQ(entries[0].description, "Zsh config");
    EXPECT_EQ(entries[0].source, REPO_ROOT / ".zshrc");
    EXPECT_EQ(entries[0].target, HOME_DIR / ".zshrc");
    EXPECT_EQ(entries[1].source, REPO_ROOT / ".config/git");
    EXPECT_EQ(entries[1].target, HOME_DIR / ".config/git");
}

TEST_F(RegistryTest, PathFieldOverridesKey) {
    write_links(R"({"links": [
        {"key": "ghostty", "description": "Terminal", "path": ".config/ghostty"}
    ]})");

    auto entries = load_link_entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].key, "ghostty");
    EXPECT_EQ(entries[0].source, REPO_ROOT / ".config/ghostty");
    EXPECT_EQ(entries[0].target, HOME_DIR / ".config/ghostty");
}

TEST_F(RegistryTest, RejectsMalformedFiles) {
    write_links(R"({"entries": []})");
    EXPECT_THROW(load_link_entries(), DotstrapException);

    write_links(R"({"links": ["oops"]})");
    EXPECT_THROW(load_link_entries(), DotstrapException);

    write_links(R"({"links": [{"key": ".zshrc"}]})");
    EXPECT_THROW(load_link_entries(), DotstrapException);

    write_links(R"({"links": [{"key": 3, "description": "x"}]})");
    EXPECT_THROW(load_link_entries(), DotstrapException);

    write_links("{ broken");
    EXPECT_THROW(load_link_entries(), DotstrapException);
}

TEST_F(RegistryTest, MissingFileThrows) {
    EXPECT_THROW(load_link_entries(), DotstrapException);
}

TEST_F(RegistryTest, RejectsDuplicateKeys) {
    write_links(R"({"links": [
        {"key": ".zshrc", "description": "a"},
        {"key": ".zshrc", "description": "b"}
    ]})");
    EXPECT_THROW(load_link_entries(), DotstrapException);
}

TEST_F(RegistryTest, RejectsPathsEscapingRoots) {
    write_links(R"({"links": [{"key": "/etc/passwd", "description": "x"}]})");
    EXPECT_THROW(load_link_entries(), DotstrapException);

    write_links(R"({"links": [{"key": "../outside", "description": "x"}]})");
    EXPECT_THROW(load_link_entries(), DotstrapException);

    write_links(R"({"links": [{"key": "ok", "description": "x", "path": "a/../../b"}]})");
    EXPECT_THROW(load_link_entries(), DotstrapException);
}

TEST_F(RegistryTest, ResolvePreservesRequestOrderAndDropsRepeats) {
    write_links(R"({"links": [
        {"key": ".zshrc", "description": "a"},
        {"key": ".gitconfig", "description": "b"},
        {"key": ".config/nvim", "description": "c"}
    ]})");
    auto entries = load_link_entries();

    auto chosen = resolve_entries(entries, {".config/nvim", " .zshrc ", ".config/nvim"}, false);
    ASSERT_EQ(chosen.size(), 2u);
    EXPECT_EQ(chosen[0].key, ".config/nvim");
    EXPECT_EQ(chosen[1].key, ".zshrc");
}

TEST_F(RegistryTest, ResolveAllReturnsEveryEntry) {
    write_links(R"({"links": [
        {"key": ".zshrc", "description": "a"},
        {"key": ".gitconfig", "description": "b"}
    ]})");
    auto entries = load_link_entries();

    auto chosen = resolve_entries(entries, {"ignored"}, true);
    ASSERT_EQ(chosen.size(), 2u);
    EXPECT_EQ(chosen[0].key, ".zshrc");
    EXPECT_EQ(chosen[1].key, ".gitconfig");
}

TEST_F(RegistryTest, ResolveUnknownKeysIsUsageError) {
    write_links(R"({"links": [{"key": ".zshrc", "description": "a"}]})");
    auto entries = load_link_entries();

    try {
        resolve_entries(entries, {".zshrc", ".vimrc", ".tmux.conf"}, false);
        FAIL() << "Expected UsageError";
    } catch (const UsageError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find(".vimrc"), std::string::npos);
        EXPECT_NE(msg.find(".tmux.conf"), std::string::npos);
    }
}

TEST_F(RegistryTest, SummaryUsesHomeShorthand) {
    ManagedEntry entry{".zshrc", "Zsh", REPO_ROOT / ".zshrc", HOME_DIR / ".zshrc"};
    EXPECT_EQ(link_target_summary(entry), (REPO_ROOT / ".zshrc").string() + " -> ~/.zshrc");
}

TEST_F(RegistryTest, ValidateReportsDuplicateKeys) {
    fs::copy_file(fs::path(DOTSTRAP_SOURCE_DIR) / "schemas/links.schema.json", LINKS_SCHEMA);
    write_links(R"({"links": [
        {"key": ".zshrc", "description": "a"},
        {"key": ".gitconfig", "description": "b"},
        {"key": ".zshrc", "description": "c"}
    ]})");

    auto errors = validate_links_file();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "links[2]: duplicate key '.zshrc'");
}

TEST_F(RegistryTest, ValidateCombinesSchemaErrors) {
    fs::copy_file(fs::path(DOTSTRAP_SOURCE_DIR) / "schemas/links.schema.json", LINKS_SCHEMA);
    write_links(R"({"links": [
        {"key": ".zshrc"},
        {"key": ".zshrc", "description": "b", "mode": "copy"}
    ], "version": 2})");

    auto errors = validate_links_file();
    ASSERT_EQ(errors.size(), 4u);
    EXPECT_EQ(errors[0], "unexpected key: version");
    EXPECT_EQ(errors[1], "links[0]: missing required field: description");
    EXPECT_EQ(errors[2], "links[1]: unexpected field: mode");
    EXPECT_EQ(errors[3], "links[1]: duplicate key '.zshrc'");
}
