#include "verify.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "reconcile.hpp"
#include "utils.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <regex>

namespace fs = std::filesystem;

namespace {

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

std::string relative_to_repo(const fs::path& path) {
    const fs::path rel = path.lexically_relative(REPO_ROOT);
    if (rel.empty() || *rel.begin() == "..") {
        return display_path(path);
    }
    return rel.string();
}

} // anonymous namespace

VerifyReport::VerifyReport(std::ostream& out) : out_(out) {}

void VerifyReport::section(std::string_view title) {
    if (in_section_) {
        out_ << '\n';
    }
    out_ << "-- " << title << " --" << '\n';
    in_section_ = true;
}

void VerifyReport::ok(std::string_view message) {
    ++ok_;
    emit("OK", COLOR_GREEN, message);
}

void VerifyReport::fail(std::string_view message) {
    fail(std::string_view("FAIL"), message);
}

void VerifyReport::fail(std::string_view token, std::string_view message) {
    ++fail_;
    emit(token, COLOR_RED, message);
}

void VerifyReport::summary() {
    if (in_section_) {
        out_ << '\n';
    }
    out_ << std::format("Summary: {} ok, {} fail", ok_, fail_) << '\n';
}

int VerifyReport::exit_code() const {
    return fail_ == 0 ? EXIT_OK : EXIT_VERIFY_FAILED;
}

void VerifyReport::emit(std::string_view token, std::string_view color, std::string_view message) {
    const std::string padded = std::format("{:<7}", token);
    if (stream_is_tty(out_)) {
        out_ << color << padded << COLOR_RESET << ' ' << message << '\n';
    } else {
        out_ << padded << ' ' << message << '\n';
    }
}

void verify_symlinks(const std::vector<ManagedEntry>& entries, VerifyReport& report) {
    for (const auto& entry : entries) {
        const StatusReport current = classify(entry);
        if (current.status == EntryStatus::Linked) {
            report.ok(entry.key);
        } else {
            report.fail(std::format("{} - {}: {}", entry.key, status_label(current.status), current.detail));
        }
    }
}

void verify_dependencies(const std::vector<DependencyCheck>& checks, VerifyReport& report) {
    const auto required_by = required_by_hints(checks);

    for (const auto& check : sorted_by_label(checks)) {
        const std::string message = std::format("{} - {}: {}", check.label, check_kind_name(check.kind), check.target);
        if (probe_check(check)) {
            report.ok(message);
            continue;
        }

        std::vector<std::string> hints;
        if (auto it = required_by.find(check.label); it != required_by.end()) {
            hints.push_back("required by: " + join(it->second, ", "));
        }
        if (check.install && !check.install->empty()) {
            hints.push_back("install: " + *check.install);
        }
        const std::string hint = hints.empty() ? "" : " (" + join(hints, ", ") + ")";
        report.fail("MISSING", message + hint);
    }
}

void verify_config_files(VerifyReport& report) {
    const std::pair<fs::path, std::vector<std::string>> results[] = {
        {DEPS_FILE, validate_deps_file()},
        {LINKS_FILE, validate_links_file()},
    };
    for (const auto& [file, errors] : results) {
        if (errors.empty()) {
            report.ok(relative_to_repo(file));
            continue;
        }
        for (const auto& error : errors) {
            report.fail(error);
        }
    }
}

std::vector<std::pair<size_t, std::string>> find_hardcoded_paths(const fs::path& file) {
    static const std::regex home_regex(R"(/(Users|home)/[^\s/]+)");

    std::ifstream in(file);
    if (!in.is_open()) {
        throw DotstrapException(string_format("error.open_file_failed", file.string()));
    }

    std::vector<std::pair<size_t, std::string>> violations;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (std::regex_search(line, home_regex)) {
            violations.emplace_back(lineno, line);
        }
    }
    return violations;
}

void verify_hardcoded_paths(const fs::path& file, VerifyReport& report) {
    std::vector<std::pair<size_t, std::string>> violations;
    try {
        violations = find_hardcoded_paths(file);
    } catch (const DotstrapException& e) {
        report.fail(e.what());
        return;
    }

    if (violations.empty()) {
        report.ok("No hardcoded paths found");
        return;
    }
    const std::string name = file.filename().string();
    for (const auto& [lineno, text] : violations) {
        report.fail(std::format("{}:{}: {}", name, lineno, text));
    }
}

void verify_git_hooks(const fs::path& hook_file, VerifyReport& report) {
    std::error_code ec;
    if (fs::is_regular_file(hook_file, ec)) {
        std::ifstream in(hook_file);
        const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (content.find("pre-commit") != std::string::npos) {
            report.ok("git hooks installed");
            return;
        }
    }
    report.fail("git hooks not installed (run: pre-commit install)");
}

int run_verify(std::ostream& out) {
    VerifyReport report(out);

    report.section("Symlink health");
    try {
        verify_symlinks(load_link_entries(), report);
    } catch (const DotstrapException& e) {
        report.fail(e.what());
    }

    report.section("Dependencies");
    try {
        verify_dependencies(load_dep_checks(), report);
    } catch (const DotstrapException& e) {
        report.fail(e.what());
    }

    report.section("Config validation");
    verify_config_files(report);

    if (fs::is_regular_file(ZSHRC_FILE)) {
        report.section("Hardcoded home paths");
        verify_hardcoded_paths(ZSHRC_FILE, report);
    }

    report.section("Pre-commit hooks");
    verify_git_hooks(PRE_COMMIT_HOOK, report);

    report.summary();
    if (report.fail_count() > 0) {
        log_warning(string_format("warning.verify_failed", report.fail_count()));
    }
    return report.exit_code();
}

bool zshrc_references(const std::string& pattern, const fs::path& file) {
    std::regex regex;
    try {
        regex = std::regex(pattern);
    } catch (const std::regex_error&) {
        return false;
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        throw DotstrapException(string_format("error.open_file_failed", file.string()));
    }
    std::string line;
    while (std::getline(in, line)) {
        const auto first = line.find_first_not_of(" \t");
        if (first != std::string::npos && line[first] == '#') {
            continue;
        }
        if (std::regex_search(line, regex)) {
            return true;
        }
    }
    return false;
}

fs::path find_zshrc(const std::optional<fs::path>& requested) {
    if (requested) {
        if (!fs::is_regular_file(*requested)) {
            throw UsageError(string_format("error.zshrc_not_found", requested->string()));
        }
        return *requested;
    }
    for (const auto& candidate : {ZSHRC_FILE, HOME_DIR / ".zshrc"}) {
        if (fs::is_regular_file(candidate)) {
            return candidate;
        }
    }
    throw UsageError(string_format("error.zshrc_not_found", (HOME_DIR / ".zshrc").string()));
}

int run_zshrc_deps(const fs::path& zshrc, std::ostream& out) {
    size_t ok = 0, missing = 0, skipped = 0;

    out << "Checking dependencies from: " << zshrc.string() << '\n';
    for (const auto& check : sorted_by_label(load_dep_checks())) {
        if (check.pattern && !check.pattern->empty() && !zshrc_references(*check.pattern, zshrc)) {
            out << format_token_line("SKIP", check.label + " - not referenced in .zshrc") << '\n';
            ++skipped;
            continue;
        }

        const std::string message = std::format("{} - {}: {}", check.label, check_kind_name(check.kind), check.target);
        if (probe_check(check)) {
            out << format_token_line("OK", message) << '\n';
            ++ok;
        } else {
            out << format_token_line("MISSING", message) << '\n';
            ++missing;
        }
    }

    out << '\n' << std::format("Summary: ok={} missing={} skipped={}", ok, missing, skipped) << '\n';
    return missing == 0 ? EXIT_OK : EXIT_VERIFY_FAILED;
}
