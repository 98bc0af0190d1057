// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <ferry/core/progress.hpp>
#include <expected>
#include <filesystem>
#include <string>

namespace ferry::core {

// A streaming GET into a directory
struct DownloadRequest {
    std::string url;
    std::filesystem::path dest_dir;
    std::string fallback_name;      // Used when neither header nor URL names the file
};

// HTTP GET abstraction used by the pipelines
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // GET the whole body as text
    [[nodiscard]] virtual std::expected<std::string, Failure>
    fetch_text(const std::string& url) = 0;

    // Stream the body to dest_dir/<resolved name>; returns the final path.
    // Name priority: Content-Disposition, URL path tail, fallback_name.
    [[nodiscard]] virtual std::expected<std::filesystem::path, Failure>
    download(const DownloadRequest& request, const ProgressFn& progress) = 0;
};

} // namespace ferry::core
