#include "dep_graph.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "schema.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <deque>
#include <format>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::string replace_all(std::string text, std::string_view from, std::string_view to) {
    if (from.empty()) return text;
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::string casefold(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Each dependency counts once per check
std::vector<std::string> unique_depends(const DependencyCheck& check) {
    std::vector<std::string> result;
    std::set<std::string> seen;
    for (const auto& dep : check.depends) {
        if (seen.insert(dep).second) {
            result.push_back(dep);
        }
    }
    return result;
}

bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

// Lenient conversion for graph checks on documents that may still carry schema errors
std::vector<DependencyCheck> graph_view(const json& items) {
    std::vector<DependencyCheck> checks;
    for (const auto& item : items) {
        DependencyCheck check{"", CheckKind::Command, "", {}, std::nullopt};
        if (item.is_object()) {
            if (auto it = item.find("label"); it != item.end() && it->is_string()) {
                check.label = it->get<std::string>();
            }
            if (auto it = item.find("depends"); it != item.end() && it->is_array()) {
                for (const auto& dep : *it) {
                    if (dep.is_string()) check.depends.push_back(dep.get<std::string>());
                }
            }
        }
        checks.push_back(std::move(check));
    }
    return checks;
}

} // anonymous namespace

std::optional<CheckKind> parse_check_kind(std::string_view name) {
    if (name == "command") return CheckKind::Command;
    if (name == "dir") return CheckKind::Dir;
    if (name == "file") return CheckKind::File;
    return std::nullopt;
}

std::string_view check_kind_name(CheckKind kind) {
    switch (kind) {
        case CheckKind::Command: return "command";
        case CheckKind::Dir: return "dir";
        case CheckKind::File: return "file";
    }
    return "unknown";
}

std::vector<DependencyCheck> parse_dep_checks(const json& data, const fs::path& home) {
    if (!data.is_object() || !data.contains("checks") || !data["checks"].is_array()) {
        throw DotstrapException(get_string("error.deps_malformed"));
    }

    std::vector<DependencyCheck> checks;
    size_t index = 0;
    for (const auto& item : data["checks"]) {
        try {
            const std::string kind_name = item.at("kind").get<std::string>();
            auto kind = parse_check_kind(kind_name);
            if (!kind) {
                throw DotstrapException(string_format("error.unknown_check_kind", kind_name));
            }

            DependencyCheck check{
                item.at("label").get<std::string>(),
                *kind,
                replace_all(item.at("target").get<std::string>(), "$HOME", home.string()),
                {},
                std::nullopt};
            if (item.contains("depends")) {
                check.depends = item.at("depends").get<std::vector<std::string>>();
            }
            if (item.contains("install")) {
                check.install = item.at("install").get<std::string>();
            }
            if (item.contains("pattern")) {
                check.pattern = item.at("pattern").get<std::string>();
            }
            checks.push_back(std::move(check));
        } catch (const json::exception& e) {
            throw DotstrapException(string_format("error.check_malformed", index, e.what()));
        }
        ++index;
    }
    return checks;
}

std::vector<DependencyCheck> load_dep_checks(const fs::path& deps_file, const fs::path& home) {
    return parse_dep_checks(read_json_file(deps_file), home);
}

std::vector<DependencyCheck> load_dep_checks() {
    return load_dep_checks(DEPS_FILE, HOME_DIR);
}

DependencyGraph DependencyGraph::build(const std::vector<DependencyCheck>& checks) {
    DependencyGraph graph;
    for (size_t i = 0; i < checks.size(); ++i) {
        if (!checks[i].label.empty()) {
            graph.nodes.emplace(checks[i].label, i);
        }
    }
    for (const auto& check : checks) {
        if (check.label.empty()) continue;
        for (const auto& dep : unique_depends(check)) {
            if (graph.nodes.contains(dep)) {
                graph.dependents[dep].push_back(check.label);
            }
        }
    }
    return graph;
}

std::vector<std::string> validate_graph(const std::vector<DependencyCheck>& checks) {
    std::vector<std::string> errors;
    const DependencyGraph graph = DependencyGraph::build(checks);

    for (size_t i = 0; i < checks.size(); ++i) {
        const auto& label = checks[i].label;
        if (!label.empty() && graph.nodes.at(label) != i) {
            errors.push_back(std::format("checks[{}]: duplicate label '{}'", i, label));
        }
    }

    for (size_t i = 0; i < checks.size(); ++i) {
        for (const auto& dep : checks[i].depends) {
            if (!graph.nodes.contains(dep)) {
                errors.push_back(std::format("checks[{}].depends: unknown label '{}'", i, dep));
            }
        }
    }

    // Kahn's algorithm over the known labels
    std::map<std::string, size_t> in_degree;
    for (const auto& [label, index] : graph.nodes) {
        in_degree.emplace(label, 0);
    }
    for (const auto& [dep, labels] : graph.dependents) {
        for (const auto& label : labels) {
            ++in_degree[label];
        }
    }

    std::deque<std::string> queue;
    for (const auto& [label, degree] : in_degree) {
        if (degree == 0) queue.push_back(label);
    }

    size_t visited = 0;
    while (!queue.empty()) {
        const std::string node = queue.front();
        queue.pop_front();
        ++visited;
        auto it = graph.dependents.find(node);
        if (it == graph.dependents.end()) continue;
        for (const auto& child : it->second) {
            if (--in_degree[child] == 0) {
                queue.push_back(child);
            }
        }
    }

    if (visited < in_degree.size()) {
        std::string members;
        for (const auto& [label, degree] : in_degree) {
            if (degree == 0) continue;
            if (!members.empty()) members += ", ";
            members += label;
        }
        errors.push_back("dependency cycle detected among: " + members);
    }

    return errors;
}

std::map<std::string, std::vector<std::string>> required_by_hints(const std::vector<DependencyCheck>& checks) {
    std::map<std::string, std::vector<std::string>> required_by;
    for (const auto& check : checks) {
        for (const auto& dep : unique_depends(check)) {
            required_by[dep].push_back(check.label);
        }
    }
    for (auto& [dep, labels] : required_by) {
        std::ranges::sort(labels);
    }
    return required_by;
}

std::vector<std::string> validate_deps_file(const fs::path& deps_file, const fs::path& schema_file) {
    SchemaOptions options;
    options.extra_validator = [](const json& items, std::vector<std::string>& errors) {
        for (auto& error : validate_graph(graph_view(items))) {
            errors.push_back(std::move(error));
        }
    };
    return validate_schema_file(deps_file, schema_file, "checks", options);
}

std::vector<std::string> validate_deps_file() {
    return validate_deps_file(DEPS_FILE, DEPS_SCHEMA);
}

bool command_exists(const std::string& command) {
    if (command.empty()) {
        return false;
    }
    if (command.find('/') != std::string::npos) {
        return is_executable_file(command);
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return false;
    }
    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        if (is_executable_file(fs::path(dir) / command)) {
            return true;
        }
    }
    return false;
}

bool probe_check(const DependencyCheck& check) {
    std::error_code ec;
    switch (check.kind) {
        case CheckKind::Command:
            return command_exists(check.target);
        case CheckKind::Dir:
            return fs::is_directory(check.target, ec);
        case CheckKind::File:
            return fs::is_regular_file(check.target, ec);
    }
    return false;
}

std::vector<DependencyCheck> sorted_by_label(std::vector<DependencyCheck> checks) {
    std::ranges::stable_sort(checks, [](const DependencyCheck& a, const DependencyCheck& b) {
        return casefold(a.label) < casefold(b.label);
    });
    return checks;
}
