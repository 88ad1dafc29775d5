#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

fs::path CONFIG_DIR = NUDL_CONF_DIR;
fs::path INDEX_CONF = fs::path(NUDL_CONF_DIR) / "index.conf";
fs::path FRAMEWORKS_CONF = fs::path(NUDL_CONF_DIR) / "frameworks.conf";

namespace {
    std::string g_index_url_override;
}

void set_config_dir(const std::string& config_dir) {
    CONFIG_DIR = fs::path(config_dir).lexically_normal();
    if (CONFIG_DIR.empty()) CONFIG_DIR = NUDL_CONF_DIR;

    INDEX_CONF = CONFIG_DIR / "index.conf";
    FRAMEWORKS_CONF = CONFIG_DIR / "frameworks.conf";
}

fs::path get_tmp_dir() {
    static const fs::path tmp_dir = fs::temp_directory_path() / ("nudl_" + std::to_string(getpid()));
    return tmp_dir;
}

void set_index_url(const std::string& url) {
    g_index_url_override = url;
}

std::string get_index_url() {
    std::string index_url = g_index_url_override;
    if (index_url.empty()) {
        std::ifstream index_file(INDEX_CONF);
        if (!index_file.is_open()) {
            throw NudlException(string_format("error.open_file_failed", INDEX_CONF.string()));
        }
        if (!std::getline(index_file, index_url)) {
            throw NudlException(get_string("error.invalid_index_config"));
        }
        index_url = trim(index_url);
    }
    if (index_url.empty()) {
        throw NudlException(get_string("error.invalid_index_config"));
    }
    if (index_url.back() != '/') {
        index_url += '/';
    }
    return index_url;
}

std::set<std::string> get_default_frameworks() {
    if (!fs::exists(FRAMEWORKS_CONF)) {
        return {};
    }
    return read_set_from_file(FRAMEWORKS_CONF);
}
