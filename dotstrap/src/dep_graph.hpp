#pragma once

#include "utils.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class CheckKind {
    Command,
    Dir,
    File
};

struct DependencyCheck {
    std::string label;
    CheckKind kind;
    std::string target;
    std::vector<std::string> depends;
    std::optional<std::string> install;
    // Regex that .zshrc must reference for the check to apply
    std::optional<std::string> pattern;
};

std::optional<CheckKind> parse_check_kind(std::string_view name);
std::string_view check_kind_name(CheckKind kind);

// Parses a `checks` document; "$HOME" in targets is replaced by `home`.
std::vector<DependencyCheck> parse_dep_checks(const json& data, const std::filesystem::path& home);
std::vector<DependencyCheck> load_dep_checks(const std::filesystem::path& deps_file, const std::filesystem::path& home);
std::vector<DependencyCheck> load_dep_checks();

// Node and edge collections of the declared checks. An edge dep -> label
// means label is ordered after dep.
struct DependencyGraph {
    std::map<std::string, size_t> nodes;                      // label -> first declaring index
    std::map<std::string, std::vector<std::string>> dependents; // dep -> labels declaring it

    static DependencyGraph build(const std::vector<DependencyCheck>& checks);
};

// Unknown dependency labels, duplicate labels and cycles. A cycle is reported
// once, listing every label Kahn's algorithm could not visit. Checks with an
// empty label are not graph nodes but their depends are still resolved.
std::vector<std::string> validate_graph(const std::vector<DependencyCheck>& checks);

// label -> sorted labels that declare it as a dependency
std::map<std::string, std::vector<std::string>> required_by_hints(const std::vector<DependencyCheck>& checks);

// Schema validation of a deps document plus graph validation of its checks
std::vector<std::string> validate_deps_file(const std::filesystem::path& deps_file,
                                            const std::filesystem::path& schema_file);
std::vector<std::string> validate_deps_file();

// Live probe of one check against the environment
bool probe_check(const DependencyCheck& check);
bool command_exists(const std::string& command);

// Checks in case-insensitive label order
std::vector<DependencyCheck> sorted_by_label(std::vector<DependencyCheck> checks);
