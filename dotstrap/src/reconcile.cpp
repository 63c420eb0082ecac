#include "reconcile.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace {

// Same bound the kernel uses for ELOOP
constexpr int MAX_SYMLINK_HOPS = 40;

fs::path canonical_parent(const fs::path& path) {
    std::error_code ec;
    fs::path parent = fs::weakly_canonical(path.parent_path(), ec);
    if (ec) {
        parent = path.parent_path();
    }
    return parent / path.filename();
}

} // anonymous namespace

std::string_view status_name(EntryStatus status) {
    switch (status) {
        case EntryStatus::MissingSource: return "missing-source";
        case EntryStatus::Linked: return "linked";
        case EntryStatus::BrokenLink: return "broken-link";
        case EntryStatus::LinkedElsewhere: return "linked-elsewhere";
        case EntryStatus::Exists: return "exists";
        case EntryStatus::TargetDir: return "target-dir";
        case EntryStatus::Absent: return "absent";
    }
    return "unknown";
}

std::string_view status_label(EntryStatus status) {
    switch (status) {
        case EntryStatus::MissingSource: return "MISSING";
        case EntryStatus::Linked: return "LINKED";
        case EntryStatus::BrokenLink: return "BROKEN";
        case EntryStatus::LinkedElsewhere: return "OTHER";
        case EntryStatus::Exists: return "EXISTS";
        case EntryStatus::TargetDir: return "DIR";
        case EntryStatus::Absent: return "ABSENT";
    }
    return "UNKNOWN";
}

std::optional<ReplacePolicy> parse_replace_policy(std::string_view name) {
    if (name == "safe") return ReplacePolicy::Safe;
    if (name == "backup") return ReplacePolicy::Backup;
    if (name == "force") return ReplacePolicy::Force;
    return std::nullopt;
}

std::string_view policy_name(ReplacePolicy policy) {
    switch (policy) {
        case ReplacePolicy::Safe: return "safe";
        case ReplacePolicy::Backup: return "backup";
        case ReplacePolicy::Force: return "force";
    }
    return "unknown";
}

fs::path resolve_non_strict(const fs::path& path) {
    fs::path current = canonical_parent(fs::absolute(path).lexically_normal());
    for (int hops = 0; hops < MAX_SYMLINK_HOPS; ++hops) {
        std::error_code ec;
        if (!fs::is_symlink(current, ec)) {
            break;
        }
        const fs::path dest = fs::read_symlink(current, ec);
        if (ec) {
            break;
        }
        const fs::path next = dest.is_absolute() ? dest : current.parent_path() / dest;
        current = canonical_parent(next.lexically_normal());
    }

    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(current, ec);
    return ec ? current.lexically_normal() : resolved;
}

StatusReport classify(const ManagedEntry& entry) {
    if (!path_occupied(entry.source)) {
        return {EntryStatus::MissingSource, "source missing"};
    }

    std::error_code ec;
    const fs::file_status target_status = fs::symlink_status(entry.target, ec);

    if (fs::is_symlink(target_status)) {
        const fs::path target_resolved = resolve_non_strict(entry.target);
        const fs::path source_resolved = resolve_non_strict(entry.source);
        std::string detail = "points to " + display_path(target_resolved);

        if (target_resolved == source_resolved) {
            return {EntryStatus::Linked, std::move(detail)};
        }
        if (!fs::exists(entry.target, ec)) {
            return {EntryStatus::BrokenLink, std::move(detail)};
        }
        return {EntryStatus::LinkedElsewhere, std::move(detail)};
    }

    if (fs::exists(target_status)) {
        if (fs::is_directory(target_status)) {
            return {EntryStatus::TargetDir, "target is a directory"};
        }
        return {EntryStatus::Exists, "target exists"};
    }

    return {EntryStatus::Absent, "target missing"};
}

fs::path backup_path_for(const fs::path& target, std::time_t when) {
    std::tm local{};
    localtime_r(&when, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &local);

    const std::string base = target.filename().string() + ".bak." + stamp;
    fs::path candidate = target.parent_path() / base;
    for (int counter = 1; path_occupied(candidate); ++counter) {
        candidate = target.parent_path() / (base + "." + std::to_string(counter));
    }
    return candidate;
}

fs::path backup_path_for(const fs::path& target) {
    return backup_path_for(target, std::time(nullptr));
}

std::optional<fs::path> remove_target(const fs::path& target, ReplacePolicy policy, bool dry_run, std::ostream& out) {
    if (!path_occupied(target)) {
        return std::nullopt;
    }

    std::error_code ec;
    if (fs::is_directory(fs::symlink_status(target, ec))) {
        throw DotstrapException(string_format("error.target_is_directory", display_path(target)));
    }

    switch (policy) {
        case ReplacePolicy::Safe:
            return std::nullopt;

        case ReplacePolicy::Backup: {
            fs::path backup = backup_path_for(target);
            if (dry_run) {
                out << format_token_line("DRYRUN", "mv " + display_path(target) + " " + display_path(backup)) << '\n';
                return backup;
            }
            fs::rename(target, backup);
            return backup;
        }

        case ReplacePolicy::Force:
            if (dry_run) {
                out << format_token_line("DRYRUN", "rm " + display_path(target)) << '\n';
                return std::nullopt;
            }
            fs::remove(target);
            return std::nullopt;
    }
    return std::nullopt;
}

void ensure_parent_dir(const fs::path& path, bool dry_run, std::ostream& out) {
    const fs::path parent = path.parent_path();
    if (parent.empty() || fs::exists(parent)) {
        return;
    }
    if (dry_run) {
        out << format_token_line("DRYRUN", "mkdir -p " + display_path(parent)) << '\n';
        return;
    }
    ensure_dir_exists(parent);
}

void create_link(const ManagedEntry& entry, bool dry_run, std::ostream& out) {
    ensure_parent_dir(entry.target, dry_run, out);
    if (dry_run) {
        out << format_token_line("DRYRUN", "ln -s " + display_path(entry.source) + " " + display_path(entry.target)) << '\n';
        return;
    }
    fs::create_symlink(entry.source, entry.target);
}

std::string format_token_line(std::string_view token, std::string_view text) {
    return std::format("{:<7} {}", token, text);
}

std::string format_action_line(std::string_view token, std::string_view key, std::string_view text) {
    return std::format("{:<7} {:<22} {}", token, key, text);
}

bool LinkResult::failed() const {
    return std::ranges::any_of(entries, [](const EntryResult& r) { return r.outcome == LinkOutcome::Error; });
}

size_t LinkResult::count(LinkOutcome outcome) const {
    return static_cast<size_t>(std::ranges::count_if(entries, [&](const EntryResult& r) { return r.outcome == outcome; }));
}

LinkTask::LinkTask(ReplacePolicy policy, bool dry_run, std::ostream& out)
    : policy_(policy), dry_run_(dry_run), out_(out) {}

LinkResult LinkTask::apply(const std::vector<ManagedEntry>& entries) {
    LinkResult result;
    for (const auto& entry : entries) {
        try {
            result.entries.push_back(link_entry(entry));
        } catch (const DotstrapException& e) {
            report("ERROR", entry.key, e.what());
            result.entries.push_back({entry.key, LinkOutcome::Error, e.what(), std::nullopt});
        } catch (const fs::filesystem_error& e) {
            report("ERROR", entry.key, e.what());
            result.entries.push_back({entry.key, LinkOutcome::Error, e.what(), std::nullopt});
        }
    }
    return result;
}

EntryResult LinkTask::link_entry(const ManagedEntry& entry) {
    const StatusReport current = classify(entry);

    switch (current.status) {
        case EntryStatus::MissingSource:
            report("ERROR", entry.key, "source missing: " + display_path(entry.source));
            return {entry.key, LinkOutcome::Error, "source missing", std::nullopt};

        case EntryStatus::Linked:
            report("SKIP", entry.key, "already linked");
            return {entry.key, LinkOutcome::Skipped, "already linked", std::nullopt};

        case EntryStatus::TargetDir:
            report("ERROR", entry.key, "target is a directory: " + display_path(entry.target));
            return {entry.key, LinkOutcome::Error, "target is a directory", std::nullopt};

        case EntryStatus::BrokenLink:
        case EntryStatus::LinkedElsewhere:
        case EntryStatus::Exists:
        case EntryStatus::Absent:
            break;
    }

    std::optional<fs::path> backup;
    if (path_occupied(entry.target)) {
        if (policy_ == ReplacePolicy::Safe) {
            report("SKIP", entry.key, "target exists (use --mode backup/force)");
            return {entry.key, LinkOutcome::Skipped, "target exists", std::nullopt};
        }
        backup = remove_target(entry.target, policy_, dry_run_, out_);
    }

    if (backup && !dry_run_) {
        report("BACKUP", entry.key, display_path(*backup));
    }

    try {
        create_link(entry, dry_run_, out_);
    } catch (const std::exception&) {
        if (backup && !dry_run_) {
            restore_backup(entry, *backup);
        }
        throw;
    }

    const std::string summary = link_target_summary(entry);
    report(dry_run_ ? "DRYRUN" : "LINKED", entry.key, summary);
    return {entry.key, dry_run_ ? LinkOutcome::DryRun : LinkOutcome::Linked, summary, backup};
}

void LinkTask::restore_backup(const ManagedEntry& entry, const fs::path& backup) {
    if (path_occupied(entry.target) || !path_occupied(backup)) {
        return;
    }
    std::error_code ec;
    fs::rename(backup, entry.target, ec);
    if (ec) {
        log_warning(string_format("warning.restore_backup_failed", display_path(backup), ec.message()));
    }
}

void LinkTask::report(std::string_view token, std::string_view key, std::string_view text) {
    out_ << format_action_line(token, key, text) << '\n';
}

void print_status(const std::vector<ManagedEntry>& entries, std::ostream& out) {
    for (const auto& entry : entries) {
        const StatusReport current = classify(entry);
        std::string text = link_target_summary(entry);
        if (!current.detail.empty()) {
            text += " (" + current.detail + ")";
        }
        out << format_action_line(status_label(current.status), entry.key, text) << '\n';
    }
}

bool confirm_policy(ReplacePolicy policy, bool dry_run) {
    if (dry_run || policy == ReplacePolicy::Safe) {
        return true;
    }
    return user_confirms(string_format("prompt.confirm_policy", std::string(policy_name(policy))));
}
