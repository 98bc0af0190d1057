// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/media/ffmpeg_tool.hpp>
#include <ferry/core/log.hpp>
#include <ferry/core/process.hpp>

namespace ferry::media {

namespace fs = std::filesystem;

std::vector<std::string> FfmpegTool::demux_args(const fs::path& video, const fs::path& dest) const {
    return {binary_, "-y", "-i", video.string(), "-vn", "-c:a", "copy", dest.string()};
}

std::vector<std::string> FfmpegTool::remux_args(const std::string& source_url, const fs::path& dest) const {
    return {binary_, "-y", "-i", source_url, "-c", "copy", dest.string()};
}

std::expected<fs::path, core::Failure>
FfmpegTool::demux_audio(const fs::path& video, const fs::path& dest) {
    return run(demux_args(video, dest), dest);
}

std::expected<fs::path, core::Failure>
FfmpegTool::remux_stream_copy(const std::string& source_url, const fs::path& dest) {
    return run(remux_args(source_url, dest), dest);
}

std::expected<fs::path, core::Failure>
FfmpegTool::run(const std::vector<std::string>& args, const fs::path& dest) {
    auto log = core::logger("media");
    log->debug("ffmpeg -i {} -> {}", args[3], dest.string());

    auto result = core::run_process(args);
    if (!result) {
        return std::unexpected(result.error());
    }

    std::error_code ec;
    if (!result->ok() || !fs::exists(dest, ec)) {
        log->warn("ffmpeg exited with {}", result->exit_code);
        return std::unexpected(core::Failure(core::TaskErrc::process_failed,
                                             core::tail_output(result->output)));
    }
    return dest;
}

} // namespace ferry::media
