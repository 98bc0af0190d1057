// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <expected>
#include <filesystem>
#include <string>

namespace ferry::media {

// External media tool: stream copies only, never a re-encode
class MediaTool {
public:
    virtual ~MediaTool() = default;

    // Copy the audio track of `video` into `dest`; returns `dest`
    [[nodiscard]] virtual std::expected<std::filesystem::path, core::Failure>
    demux_audio(const std::filesystem::path& video, const std::filesystem::path& dest) = 0;

    // Remux a manifest or variant URL into a local container at `dest`
    [[nodiscard]] virtual std::expected<std::filesystem::path, core::Failure>
    remux_stream_copy(const std::string& source_url, const std::filesystem::path& dest) = 0;
};

} // namespace ferry::media
