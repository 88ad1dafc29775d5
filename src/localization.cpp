#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <string>
#include <unordered_map>
#include <limits.h> // For PATH_MAX
#include <unistd.h> // For readlink

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
        if (count != -1) {
            return fs::path(std::string(result, static_cast<size_t>(count))).parent_path();
        }
        return fs::current_path();
    }

    std::string detect_language() {
        const char* lang_env = getenv("LANG");
        if (lang_env && std::string(lang_env).starts_with("zh")) {
            return "zh";
        }
        return "en";
    }

    bool load_strings(const std::string& lang, const fs::path& base_dir) {
        const fs::path file_path = base_dir / (lang + ".txt");
        std::ifstream file(file_path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;
            const size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
        return true;
    }
}

void init_localization(const fs::path& l10n_dir, const std::string& lang) {
    translations.clear();
    missing_key_placeholders.clear();
    if (load_strings(lang, l10n_dir) || lang == "en") {
        return;
    }
    // The warning prefix needs a loaded table.
    load_strings("en", l10n_dir);
    log_warning(string_format("warning.l10n_fallback", lang));
}

void init_localization(const fs::path& l10n_dir) {
    init_localization(l10n_dir, detect_language());
}

void init_localization() {
    const fs::path exec_dir = get_executable_dir();
    const fs::path relative_l10n_dir = exec_dir / ".." / "l10n"; // Build tree layout: build/nudl -> l10n/

    if (fs::exists(relative_l10n_dir) && fs::is_directory(relative_l10n_dir)) {
        init_localization(relative_l10n_dir);
    } else {
        init_localization(fs::path(NUDL_L10N_DIR)); // Fallback to installed path
    }
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
