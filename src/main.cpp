#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "interrupt.hpp"
#include "localization.hpp"
#include "package_manager.hpp"
#include "repository.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>
#include <curl/curl.h>

#include <iostream>
#include <string>
#include <vector>

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.positional_help("<package>");
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("v,version", get_string("help.version"), cxxopts::value<std::string>()->default_value(""))
            ("p,prerelease", get_string("help.prerelease"), cxxopts::value<bool>()->default_value("false"))
            ("d,directory", get_string("help.directory"), cxxopts::value<std::string>()->default_value(DEFAULT_DOWNLOAD_DIR.string()))
            ("f,framework", get_string("help.framework"), cxxopts::value<std::vector<std::string>>())
            ("index", get_string("help.index"), cxxopts::value<std::string>())
            ("config-dir", get_string("help.config_dir"), cxxopts::value<std::string>())
            ("no-progress", get_string("help.no_progress"), cxxopts::value<bool>()->default_value("false"))
            ("package", "", cxxopts::value<std::string>());

        options.parse_positional({"package"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (!result.count("package")) {
            print_usage(options);
            return 1;
        }

        if (result.count("config-dir")) {
            set_config_dir(result["config-dir"].as<std::string>());
        }

        if (result.count("index")) {
            set_index_url(result["index"].as<std::string>());
        }

        PackageRequest request;
        request.id = result["package"].as<std::string>();
        request.version = trim(result["version"].as<std::string>());
        request.include_prerelease = result["prerelease"].as<bool>();
        request.download_dir = result["directory"].as<std::string>();
        if (result.count("framework")) {
            for (const auto& framework : result["framework"].as<std::vector<std::string>>()) {
                request.target_frameworks.insert(framework);
            }
        } else {
            request.target_frameworks = get_default_frameworks();
        }

        install_interrupt_handler();

        const std::string index_url = get_index_url();
        log_info(string_format("info.loading_index", index_url));
        Repository repo;
        repo.load_index(index_url);

        const bool show_progress = !result["no-progress"].as<bool>();
        RunContext ctx{
            .stop_requested = interrupt_requested,
            .progress = [](const std::string& message) { log_info(message); }
        };
        auto fetch = [show_progress](const std::string& url, const fs::path& output_path) {
            download_file(url, output_path, show_progress);
        };

        switch (process_package(request, repo, ctx, fetch)) {
            case RunOutcome::Done:
                return 0;
            case RunOutcome::Stopped:
                return 130;
            case RunOutcome::Failed:
                return 1;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const NudlException& e) {
        log_error(string_format("error.nudl_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
