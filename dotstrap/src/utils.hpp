#pragma once

#include "exception.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

using json = nlohmann::ordered_json;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// True when the stream is stdout/stderr attached to a terminal
bool stream_is_tty(const std::ostream& stream);

// Interactive mode control
enum class NonInteractiveMode {
    INTERACTIVE,
    YES,
    NO
};

void set_non_interactive_mode(NonInteractiveMode mode);
NonInteractiveMode get_non_interactive_mode();

bool user_confirms(const std::string& prompt);

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);

// Exists, or is a symlink (dangling or not)
bool path_occupied(const fs::path& path);

// Renders paths under the home directory as "~/..."
std::string display_path(const fs::path& path);

// Joins a relative path onto root, refusing absolute paths and ".." traversal
fs::path validate_path(const fs::path& path, const fs::path& root);

json read_json_file(const fs::path& path);
