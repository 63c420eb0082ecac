#pragma once

#include <filesystem>
#include <string>
#include <vector>

struct ManagedEntry {
    std::string key;
    std::string description;
    std::filesystem::path source;
    std::filesystem::path target;
};

// Loads links.json; sources resolve under repo_root, targets under home.
std::vector<ManagedEntry> load_link_entries(const std::filesystem::path& links_file,
                                            const std::filesystem::path& repo_root,
                                            const std::filesystem::path& home);
std::vector<ManagedEntry> load_link_entries();

// Selects entries by key in request order, dropping repeats.
// Throws UsageError naming every unknown key.
std::vector<ManagedEntry> resolve_entries(const std::vector<ManagedEntry>& entries,
                                          const std::vector<std::string>& keys,
                                          bool use_all);

// Schema validation of links.json plus duplicate key detection
std::vector<std::string> validate_links_file(const std::filesystem::path& links_file,
                                             const std::filesystem::path& schema_file);
std::vector<std::string> validate_links_file();

// "<source> -> <target>" in display form
std::string link_target_summary(const ManagedEntry& entry);
