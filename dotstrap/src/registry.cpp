#include "registry.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "schema.hpp"
#include "utils.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <unordered_map>

namespace fs = std::filesystem;

namespace {

std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

std::string required_string(const json& item, const char* field, size_t index) {
    auto it = item.find(field);
    if (it == item.end() || !it->is_string()) {
        throw DotstrapException(string_format("error.link_field_missing", index, std::string(field)));
    }
    return it->get<std::string>();
}

} // anonymous namespace

std::vector<ManagedEntry> load_link_entries(const fs::path& links_file, const fs::path& repo_root, const fs::path& home) {
    const json data = read_json_file(links_file);
    if (!data.is_object() || !data.contains("links") || !data["links"].is_array()) {
        throw DotstrapException(string_format("error.links_malformed", links_file.string()));
    }

    std::vector<ManagedEntry> entries;
    std::set<std::string> seen;
    size_t index = 0;
    for (const auto& item : data["links"]) {
        if (!item.is_object()) {
            throw DotstrapException(string_format("error.link_not_object", index));
        }
        ManagedEntry entry;
        entry.key = required_string(item, "key", index);
        entry.description = required_string(item, "description", index);

        std::string rel = entry.key;
        if (item.contains("path")) {
            rel = required_string(item, "path", index);
        }

        if (!seen.insert(entry.key).second) {
            throw DotstrapException(string_format("error.duplicate_link_key", entry.key));
        }
        entry.source = validate_path(rel, repo_root);
        entry.target = validate_path(rel, home);
        entries.push_back(std::move(entry));
        ++index;
    }
    return entries;
}

std::vector<ManagedEntry> load_link_entries() {
    return load_link_entries(LINKS_FILE, REPO_ROOT, HOME_DIR);
}

std::vector<ManagedEntry> resolve_entries(const std::vector<ManagedEntry>& entries, const std::vector<std::string>& keys, bool use_all) {
    if (use_all) {
        return entries;
    }

    std::unordered_map<std::string, const ManagedEntry*> lookup;
    for (const auto& entry : entries) {
        lookup.emplace(entry.key, &entry);
    }

    std::vector<ManagedEntry> chosen;
    std::vector<std::string> unknown;
    for (const auto& raw : keys) {
        auto it = lookup.find(trim(raw));
        if (it == lookup.end()) {
            unknown.push_back(raw);
            continue;
        }
        const bool already = std::ranges::any_of(chosen, [&](const ManagedEntry& e) { return e.key == it->second->key; });
        if (!already) {
            chosen.push_back(*it->second);
        }
    }

    if (!unknown.empty()) {
        std::string joined;
        for (const auto& key : unknown) {
            if (!joined.empty()) joined += ", ";
            joined += key;
        }
        throw UsageError(string_format("error.unknown_targets", joined));
    }
    return chosen;
}

std::string link_target_summary(const ManagedEntry& entry) {
    return display_path(entry.source) + " -> " + display_path(entry.target);
}

std::vector<std::string> validate_links_file(const fs::path& links_file, const fs::path& schema_file) {
    SchemaOptions options;
    options.extra_validator = [](const json& items, std::vector<std::string>& errors) {
        std::set<std::string> seen;
        size_t index = 0;
        for (const auto& item : items) {
            if (item.is_object()) {
                if (auto it = item.find("key"); it != item.end() && it->is_string()) {
                    if (!seen.insert(it->get<std::string>()).second) {
                        errors.push_back(std::format("links[{}]: duplicate key '{}'", index, it->get<std::string>()));
                    }
                }
            }
            ++index;
        }
    };
    return validate_schema_file(links_file, schema_file, "links", options);
}

std::vector<std::string> validate_links_file() {
    return validate_links_file(LINKS_FILE, LINKS_SCHEMA);
}
