#pragma once

#include <string>
#include <filesystem>
#include <functional>

namespace fs = std::filesystem;

// Streams url to output_path. On failure the partial file is removed and a
// TransportError is thrown.
void download_file(const std::string& url, const fs::path& output_path, bool show_progress = true);

// Transfer seam: url -> output_path, throwing TransportError on failure.
using FetchFunction = std::function<void(const std::string& url, const fs::path& output_path)>;
