#pragma once

#include <string>
#include <filesystem>

// Lowercase hex SHA-256 digest of a file's contents.
std::string calculate_sha256(const std::filesystem::path& file_path);

bool sha256_matches(const std::filesystem::path& file_path, const std::string& expected);
