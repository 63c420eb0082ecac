#pragma once

#include "registry.hpp"

#include <ctime>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class EntryStatus {
    MissingSource,
    Linked,
    BrokenLink,
    LinkedElsewhere,
    Exists,
    TargetDir,
    Absent
};

enum class ReplacePolicy {
    Safe,
    Backup,
    Force
};

struct StatusReport {
    EntryStatus status;
    std::string detail;
};

// Canonical name ("missing-source", "linked", ...)
std::string_view status_name(EntryStatus status);
// Listing label ("MISSING", "LINKED", ...)
std::string_view status_label(EntryStatus status);

std::optional<ReplacePolicy> parse_replace_policy(std::string_view name);
std::string_view policy_name(ReplacePolicy policy);

// Follows symlink chains as far as they go, tolerating a dangling last hop.
std::filesystem::path resolve_non_strict(const std::filesystem::path& path);

// Reads the live filesystem on every call; nothing is cached.
StatusReport classify(const ManagedEntry& entry);

// "<name>.bak.YYYYmmdd-HHMMSS" beside the target, with ".N" appended while occupied.
std::filesystem::path backup_path_for(const std::filesystem::path& target, std::time_t when);
std::filesystem::path backup_path_for(const std::filesystem::path& target);

// Clears the target according to policy. Returns the backup path when one is
// (or, under dry run, would be) produced. Throws DotstrapException for a real
// directory and std::filesystem::filesystem_error for failed mutations.
std::optional<std::filesystem::path> remove_target(const std::filesystem::path& target, ReplacePolicy policy,
                                                   bool dry_run, std::ostream& out = std::cout);

void ensure_parent_dir(const std::filesystem::path& path, bool dry_run, std::ostream& out = std::cout);
void create_link(const ManagedEntry& entry, bool dry_run, std::ostream& out = std::cout);

// "{token:<7} {text}"
std::string format_token_line(std::string_view token, std::string_view text);
// "{token:<7} {key:<22} {text}"
std::string format_action_line(std::string_view token, std::string_view key, std::string_view text);

enum class LinkOutcome {
    Linked,
    Skipped,
    Error,
    DryRun
};

struct EntryResult {
    std::string key;
    LinkOutcome outcome;
    std::string message;
    std::optional<std::filesystem::path> backup;
};

struct LinkResult {
    std::vector<EntryResult> entries;

    bool failed() const;
    size_t count(LinkOutcome outcome) const;
};

class LinkTask {
public:
    LinkTask(ReplacePolicy policy, bool dry_run, std::ostream& out = std::cout);

    // Processes every entry in order; one entry's failure never stops the rest.
    LinkResult apply(const std::vector<ManagedEntry>& entries);

private:
    EntryResult link_entry(const ManagedEntry& entry);
    void restore_backup(const ManagedEntry& entry, const std::filesystem::path& backup);
    void report(std::string_view token, std::string_view key, std::string_view text);

    ReplacePolicy policy_;
    bool dry_run_;
    std::ostream& out_;
};

void print_status(const std::vector<ManagedEntry>& entries, std::ostream& out = std::cout);

// Gate for policies that modify existing targets
bool confirm_policy(ReplacePolicy policy, bool dry_run);
