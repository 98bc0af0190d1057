// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/media/media_tool.hpp>
#include <string>
#include <vector>

namespace ferry::media {

class FfmpegTool final : public MediaTool {
public:
    explicit FfmpegTool(std::string binary = "ffmpeg") : binary_(std::move(binary)) {}

    [[nodiscard]] std::expected<std::filesystem::path, core::Failure>
    demux_audio(const std::filesystem::path& video, const std::filesystem::path& dest) override;

    [[nodiscard]] std::expected<std::filesystem::path, core::Failure>
    remux_stream_copy(const std::string& source_url, const std::filesystem::path& dest) override;

    // Argument vectors, exposed for inspection
    [[nodiscard]] std::vector<std::string> demux_args(const std::filesystem::path& video,
                                                      const std::filesystem::path& dest) const;
    [[nodiscard]] std::vector<std::string> remux_args(const std::string& source_url,
                                                      const std::filesystem::path& dest) const;

private:
    [[nodiscard]] std::expected<std::filesystem::path, core::Failure>
    run(const std::vector<std::string>& args, const std::filesystem::path& dest);

    std::string binary_;
};

} // namespace ferry::media
