#include "config.hpp"
#include "dep_graph.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "reconcile.hpp"
#include "registry.hpp"
#include "utils.hpp"
#include "verify.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.list_desc") << std::endl;
    std::cerr << get_string("info.status_desc") << std::endl;
    std::cerr << get_string("info.link_desc") << std::endl;
    std::cerr << get_string("info.verify_desc") << std::endl;
    std::cerr << get_string("info.validate_desc") << std::endl;
    std::cerr << get_string("info.check_paths_desc") << std::endl;
    std::cerr << get_string("info.check_zshrc_deps_desc") << std::endl;
}

std::vector<std::string> positional_args(const cxxopts::ParseResult& result) {
    if (!result.count("args")) {
        return {};
    }
    return result["args"].as<std::vector<std::string>>();
}

int command_link(const cxxopts::ParseResult& result) {
    const auto keys = positional_args(result);
    const bool use_all = result["all"].as<bool>();
    if (keys.empty() && !use_all) {
        throw UsageError(get_string("error.no_targets"));
    }

    const std::string mode_name = result["mode"].as<std::string>();
    const auto policy = parse_replace_policy(mode_name);
    if (!policy) {
        throw UsageError(string_format("error.invalid_mode", mode_name));
    }
    const bool dry_run = result["dry-run"].as<bool>();

    const auto entries = resolve_entries(load_link_entries(), keys, use_all);
    if (!confirm_policy(*policy, dry_run)) {
        std::cout << get_string("info.aborted") << std::endl;
        return EXIT_VERIFY_FAILED;
    }

    LinkTask task(*policy, dry_run);
    const LinkResult outcome = task.apply(entries);
    if (outcome.failed()) {
        log_error(string_format("error.link_batch_failed", outcome.count(LinkOutcome::Error)));
        return EXIT_USAGE;
    }
    return EXIT_OK;
}

int command_validate() {
    std::vector<std::string> errors = validate_deps_file();
    for (auto& error : validate_links_file()) {
        errors.push_back(std::move(error));
    }
    if (errors.empty()) {
        log_info(get_string("info.validate_ok"));
        return EXIT_OK;
    }
    for (const auto& error : errors) {
        std::cout << format_token_line("FAIL", error) << std::endl;
    }
    return EXIT_VERIFY_FAILED;
}

int command_check_paths(const cxxopts::ParseResult& result) {
    int status = EXIT_OK;
    for (const auto& file : positional_args(result)) {
        if (!fs::is_regular_file(file)) {
            continue;
        }
        const auto violations = find_hardcoded_paths(file);
        if (violations.empty()) {
            continue;
        }
        log_error(string_format("error.hardcoded_home_path", file));
        for (const auto& [lineno, line] : violations) {
            std::cerr << lineno << ":" << line << std::endl;
        }
        status = EXIT_VERIFY_FAILED;
    }
    return status;
}

int command_check_zshrc_deps(const cxxopts::ParseResult& result) {
    const auto args = positional_args(result);
    std::optional<fs::path> requested;
    if (!args.empty()) {
        requested = fs::path(args.front());
    }
    return run_zshrc_deps(find_zshrc(requested));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("repo", get_string("help.repo"), cxxopts::value<std::string>())
            ("home", get_string("help.home"), cxxopts::value<std::string>())
            ("all", get_string("help.all"), cxxopts::value<bool>()->default_value("false"))
            ("mode", get_string("help.mode"), cxxopts::value<std::string>()->default_value("safe"))
            ("y,yes", get_string("help.yes"), cxxopts::value<bool>()->default_value("false"))
            ("dry-run", get_string("help.dry_run"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>())
            ("args", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "args"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return EXIT_OK;
        }

        if (!result.count("command")) {
            print_usage(options);
            return EXIT_USAGE;
        }

        init_paths();
        if (result.count("repo")) {
            set_repo_root(result["repo"].as<std::string>());
        }
        if (result.count("home")) {
            set_home_dir(result["home"].as<std::string>());
        }
        if (result["yes"].as<bool>()) {
            set_non_interactive_mode(NonInteractiveMode::YES);
        }

        const std::string& command = result["command"].as<std::string>();

        if (command == "list" || command == "status") {
            print_status(load_link_entries());
            return EXIT_OK;
        } else if (command == "link") {
            return command_link(result);
        } else if (command == "verify") {
            return run_verify();
        } else if (command == "validate") {
            return command_validate();
        } else if (command == "check-paths") {
            return command_check_paths(result);
        } else if (command == "check-zshrc-deps") {
            return command_check_zshrc_deps(result);
        }

        print_usage(options);
        return EXIT_USAGE;

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return EXIT_USAGE;
    } catch (const UsageError& e) {
        log_error(e.what());
        return EXIT_USAGE;
    } catch (const DotstrapException& e) {
        log_error(string_format("error.dotstrap_error", e.what()));
        return EXIT_VERIFY_FAILED;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return EXIT_VERIFY_FAILED;
    }
}
