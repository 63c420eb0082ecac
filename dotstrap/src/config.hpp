#pragma once

#include <string>
#include <filesystem>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path REPO_ROOT;
extern std::filesystem::path HOME_DIR;
extern std::filesystem::path L10N_DIR;

// Derived paths
extern std::filesystem::path SCRIPTS_DIR;
extern std::filesystem::path LINKS_FILE;
extern std::filesystem::path LINKS_SCHEMA;
extern std::filesystem::path DEPS_FILE;
extern std::filesystem::path DEPS_SCHEMA;
extern std::filesystem::path ZSHRC_FILE;
extern std::filesystem::path PRE_COMMIT_HOOK;

// Functions
void set_repo_root(const std::string& repo_root);
void set_home_dir(const std::string& home_dir);
std::filesystem::path detect_repo_root();
std::filesystem::path detect_home_dir();
void init_paths();
