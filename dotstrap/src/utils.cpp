#include "utils.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <fstream>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace {
    NonInteractiveMode non_interactive_mode = NonInteractiveMode::INTERACTIVE;
    std::mutex log_mutex;

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (stream_is_tty(stream)) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

bool stream_is_tty(const std::ostream& stream) {
    static const bool is_stdout_tty = isatty(STDOUT_FILENO);
    static const bool is_stderr_tty = isatty(STDERR_FILENO);

    if (&stream == &std::cout) {
        return is_stdout_tty;
    }
    if (&stream == &std::cerr) {
        return is_stderr_tty;
    }
    return false;
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void set_non_interactive_mode(NonInteractiveMode mode) {
    non_interactive_mode = mode;
}

NonInteractiveMode get_non_interactive_mode() {
    return non_interactive_mode;
}

bool user_confirms(const std::string& prompt) {
    switch (get_non_interactive_mode()) {
        case NonInteractiveMode::YES:
            return true;
        case NonInteractiveMode::NO:
            return false;
        case NonInteractiveMode::INTERACTIVE:
        default:
            // Nobody to answer the prompt
            if (!isatty(STDIN_FILENO)) {
                log_warning(get_string("warning.no_terminal_for_prompt"));
                return false;
            }
            std::cout << prompt << " " << get_string("prompt.yes_no") << " ";
            std::string response;
            std::cin >> response;
            return (response == "y" || response == "Y");
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw DotstrapException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw DotstrapException(string_format("error.path_not_dir", path.string()));
    }
}

bool path_occupied(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

std::string display_path(const fs::path& path) {
    const fs::path rel = path.lexically_relative(HOME_DIR);
    if (rel.empty() || *rel.begin() == "..") {
        return path.string();
    }
    if (rel == ".") {
        return "~";
    }
    return "~/" + rel.string();
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.empty() || path.is_absolute()) {
        throw DotstrapException(string_format("error.path_not_relative", path.string()));
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw DotstrapException(string_format("error.path_traversal", path.string()));
        }
    }
    return root / normalized;
}

json read_json_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DotstrapException(string_format("error.open_file_failed", path.string()));
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw DotstrapException(string_format("error.json_parse_failed", path.string(), e.what()));
    }
}
