#pragma once

#include <filesystem>
#include <format>
#include <string>
#include <string_view>

void init_localization();
void load_strings(const std::string& lang, const std::filesystem::path& base_dir);
const std::string& get_string(const std::string& key);

// Directory of the running binary, or the current directory when it cannot be resolved
std::filesystem::path executable_dir(const std::filesystem::path& self_link = "/proc/self/exe");

// Variadic template for string formatting using C++20 std::format
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return std::vformat(get_string(key), std::make_format_args(args...));
    } catch (const std::format_error& e) {
        return "Dotstrap Formatting Error [key: " + key + "]: " + e.what();
    }
}
