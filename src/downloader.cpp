#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <fstream>
#include <memory>

namespace {

size_t write_to_stream(void* ptr, size_t size, size_t nmemb, void* stream) {
    std::ostream* out = static_cast<std::ostream*>(stream);
    const size_t bytes = size * nmemb;
    out->write(static_cast<char*>(ptr), static_cast<std::streamsize>(bytes));
    return out->good() ? bytes : 0;
}

// clientp is the label drawn next to the bar.
int report_transfer(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    if (dltotal <= 0) {
        return 0;
    }
    const auto* label = static_cast<std::string*>(clientp);
    log_progress(*label, static_cast<double>(dlnow) / static_cast<double>(dltotal) * 100.0);
    return 0;
}

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) curl_easy_cleanup(curl);
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

[[noreturn]] void fail_transfer(const std::string& url, const fs::path& output_path, const std::string& reason) {
    std::error_code ec;
    fs::remove(output_path, ec);
    throw TransportError(string_format("error.download_failed", url) + ": " + reason);
}

} // anonymous namespace

void download_file(const std::string& url, const fs::path& output_path, bool show_progress) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw TransportError(string_format("error.download_failed", url));
    }

    std::ofstream out(output_path, std::ios::binary);
    if (!out) {
        throw TransportError(string_format("error.create_file_failed", output_path.string()));
    }

    std::string label = get_string("info.transfer") + " " + output_path.filename().string();
    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, show_progress ? 0L : 1L);
    if (show_progress) {
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, report_transfer);
        curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &label);
    }

    const CURLcode res = curl_easy_perform(handle);
    if (show_progress) {
        log_progress_end();
    }
    out.close();

    if (res != CURLE_OK) {
        fail_transfer(url, output_path, curl_easy_strerror(res));
    }
    if (!out) {
        fail_transfer(url, output_path, get_string("error.write_failed"));
    }
}
