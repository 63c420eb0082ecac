#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

fs::path REPO_ROOT = ".";
fs::path HOME_DIR = "/";
fs::path L10N_DIR = DOTSTRAP_L10N_DIR;

// Derived paths
fs::path SCRIPTS_DIR = REPO_ROOT / "scripts";
fs::path LINKS_FILE = SCRIPTS_DIR / "links.json";
fs::path LINKS_SCHEMA = SCRIPTS_DIR / "links.schema.json";
fs::path DEPS_FILE = SCRIPTS_DIR / "deps.json";
fs::path DEPS_SCHEMA = SCRIPTS_DIR / "deps.schema.json";
fs::path ZSHRC_FILE = REPO_ROOT / ".zshrc";
fs::path PRE_COMMIT_HOOK = REPO_ROOT / ".git/hooks/pre-commit";

namespace {
    // Absolute, lexically normal, no trailing separator
    fs::path normalize_dir(const std::string& dir) {
        fs::path p = fs::absolute(fs::path(dir)).lexically_normal();
        if (p.has_relative_path() && p.filename().empty()) {
            p = p.parent_path();
        }
        return p;
    }
}

void set_repo_root(const std::string& repo_root) {
    if (repo_root.empty()) {
        throw UsageError(get_string("error.empty_repo_root"));
    }
    REPO_ROOT = normalize_dir(repo_root);

    SCRIPTS_DIR = REPO_ROOT / "scripts";
    LINKS_FILE = SCRIPTS_DIR / "links.json";
    LINKS_SCHEMA = SCRIPTS_DIR / "links.schema.json";
    DEPS_FILE = SCRIPTS_DIR / "deps.json";
    DEPS_SCHEMA = SCRIPTS_DIR / "deps.schema.json";
    ZSHRC_FILE = REPO_ROOT / ".zshrc";
    PRE_COMMIT_HOOK = REPO_ROOT / ".git/hooks/pre-commit";
}

void set_home_dir(const std::string& home_dir) {
    if (home_dir.empty()) {
        throw UsageError(get_string("error.empty_home_dir"));
    }
    HOME_DIR = normalize_dir(home_dir);
}

fs::path detect_repo_root() {
    if (const char* env = std::getenv("DOTSTRAP_REPO"); env && *env) {
        return fs::path(env);
    }
    return fs::current_path();
}

fs::path detect_home_dir() {
    if (const char* env = std::getenv("HOME"); env && *env) {
        return fs::path(env);
    }
    if (const struct passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return fs::path(pw->pw_dir);
    }
    throw DotstrapException(get_string("error.home_not_found"));
}

void init_paths() {
    set_repo_root(detect_repo_root().string());
    set_home_dir(detect_home_dir().string());
}
