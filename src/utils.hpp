#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <set>
#include <filesystem>

namespace fs = std::filesystem;

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
void log_progress(const std::string& msg, double percentage, int bar_width = 50);
void log_progress_end();

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::set<std::string> read_set_from_file(const fs::path& path);

// String utilities
std::string to_lower(std::string_view s);
bool iequals(std::string_view a, std::string_view b);
std::string trim(std::string_view s);
std::vector<std::string_view> split(std::string_view s, char delim);
