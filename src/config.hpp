#pragma once

#include <string>
#include <string_view>
#include <set>
#include <filesystem>

namespace fs = std::filesystem;

#ifndef NUDL_CONF_DIR
#define NUDL_CONF_DIR "/etc/nudl"
#endif

#ifndef NUDL_L10N_DIR
#define NUDL_L10N_DIR "/usr/share/nudl/l10n"
#endif

// Global paths
extern fs::path CONFIG_DIR;
extern fs::path INDEX_CONF;
extern fs::path FRAMEWORKS_CONF;

inline const fs::path DEFAULT_DOWNLOAD_DIR = "download";
inline constexpr std::string_view ARCHIVE_EXTENSION = "nupkg";

// Functions
void set_config_dir(const std::string& config_dir);
fs::path get_tmp_dir();

void set_index_url(const std::string& url);
std::string get_index_url();
std::set<std::string> get_default_frameworks();
