#pragma once

#include "dep_graph.hpp"
#include "registry.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Tallies pass/fail lines across verification sections.
class VerifyReport {
public:
    explicit VerifyReport(std::ostream& out = std::cout);

    void section(std::string_view title);
    void ok(std::string_view message);
    void fail(std::string_view message);
    void fail(std::string_view token, std::string_view message);
    void summary();

    size_t ok_count() const { return ok_; }
    size_t fail_count() const { return fail_; }
    int exit_code() const;

private:
    void emit(std::string_view token, std::string_view color, std::string_view message);

    std::ostream& out_;
    size_t ok_ = 0;
    size_t fail_ = 0;
    bool in_section_ = false;
};

void verify_symlinks(const std::vector<ManagedEntry>& entries, VerifyReport& report);
void verify_dependencies(const std::vector<DependencyCheck>& checks, VerifyReport& report);
void verify_config_files(VerifyReport& report);
void verify_hardcoded_paths(const std::filesystem::path& file, VerifyReport& report);
void verify_git_hooks(const std::filesystem::path& hook_file, VerifyReport& report);

// (line number, line) for every "/Users/<name>" or "/home/<name>" occurrence
std::vector<std::pair<size_t, std::string>> find_hardcoded_paths(const std::filesystem::path& file);

// Runs every section against the configured repository and home directory.
int run_verify(std::ostream& out = std::cout);

// True when a non-comment line of `file` matches `pattern`. An invalid
// pattern never matches.
bool zshrc_references(const std::string& pattern, const std::filesystem::path& file);

// The given path, else the repository .zshrc, else the one in the home directory
std::filesystem::path find_zshrc(const std::optional<std::filesystem::path>& requested);

// Probes the configured checks, skipping those whose pattern .zshrc never uses
int run_zshrc_deps(const std::filesystem::path& zshrc, std::ostream& out = std::cout);
