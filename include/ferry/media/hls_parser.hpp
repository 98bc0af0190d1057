// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::media {

// One #EXT-X-STREAM-INF entry of a master playlist
struct HLSVariant {
    std::uint64_t bandwidth{0};     // Bits per second, 0 when absent
    std::uint32_t width{0};
    std::uint32_t height{0};
    std::string codecs;
    std::string url;                // Absolute
};

// Parsed playlist. A master playlist has variants; a media (leaf)
// playlist has segments only.
struct HLSPlaylist {
    std::vector<HLSVariant> variants;
    std::uint32_t segment_count{0};
    double total_duration{0.0};     // Seconds, media playlists only
    bool has_endlist{false};

    [[nodiscard]] bool is_master() const noexcept { return !variants.empty(); }
};

class HLSParser {
public:
    // Parse M3U8 text; relative URIs are resolved against `base_url`.
    // Fails with manifest_invalid when the #EXTM3U header is missing.
    [[nodiscard]] static std::expected<HLSPlaylist, std::error_code>
    parse(std::string_view content, std::string_view base_url);

    // Path (query and fragment ignored) ends with .m3u8
    [[nodiscard]] static bool is_hls_url(std::string_view url) noexcept;

private:
    // Value of KEY=... in an attribute list, quotes stripped
    [[nodiscard]] static std::string attribute(std::string_view attrs, std::string_view key);
};

} // namespace ferry::media
