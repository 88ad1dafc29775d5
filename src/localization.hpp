#pragma once

#include <string>
#include <format>
#include <string_view>
#include <filesystem>

void init_localization();
void init_localization(const std::filesystem::path& l10n_dir);
// Loads lang from l10n_dir, falling back to English when it is not shipped.
void init_localization(const std::filesystem::path& l10n_dir, const std::string& lang);
const std::string& get_string(const std::string& key);

// Variadic template for string formatting using modern C++20 std::format
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return std::vformat(get_string(key), std::make_format_args(args...));
    } catch (const std::format_error& e) {
        return "Nudl Formatting Error [key: " + key + "]: " + e.what();
    }
}
