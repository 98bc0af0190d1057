// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/media/hls_parser.hpp>
#include <ferry/core/url.hpp>
#include <charconv>

namespace ferry::media {

namespace {

constexpr std::string_view TAG_HEADER = "#EXTM3U";
constexpr std::string_view TAG_EXTINF = "#EXTINF:";
constexpr std::string_view TAG_STREAM_INF = "#EXT-X-STREAM-INF:";
constexpr std::string_view TAG_ENDLIST = "#EXT-X-ENDLIST";

template<typename T>
T to_number(std::string_view s) noexcept {
    T value{};
    std::from_chars(s.data(), s.data() + s.size(), value);
    return value;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

} // namespace

bool HLSParser::is_hls_url(std::string_view url) noexcept {
    auto base = core::strip_query_and_fragment(url);
    if (base.size() < 5) return false;
    auto ext = base.substr(base.size() - 5);
    return core::to_lower(ext) == ".m3u8";
}

std::string HLSParser::attribute(std::string_view attrs, std::string_view key) {
    std::size_t pos = 0;
    while (pos < attrs.size()) {
        auto eq = attrs.find('=', pos);
        if (eq == std::string_view::npos) break;

        auto name = trim(attrs.substr(pos, eq - pos));
        std::size_t value_start = eq + 1;
        std::size_t value_end;

        // Quoted values may contain commas (CODECS="avc1,mp4a")
        if (value_start < attrs.size() && attrs[value_start] == '"') {
            auto close = attrs.find('"', value_start + 1);
            value_end = close == std::string_view::npos ? attrs.size() : close + 1;
        } else {
            value_end = attrs.find(',', value_start);
            if (value_end == std::string_view::npos) value_end = attrs.size();
        }

        if (name == key) {
            auto value = attrs.substr(value_start, value_end - value_start);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            return std::string(value);
        }

        pos = attrs.find(',', value_end);
        if (pos == std::string_view::npos) break;
        ++pos;
    }
    return {};
}

std::expected<HLSPlaylist, std::error_code>
HLSParser::parse(std::string_view content, std::string_view base_url) {
    HLSPlaylist playlist;

    auto base = core::Url::parse(base_url);

    bool seen_header = false;
    bool pending_variant = false;
    HLSVariant variant;

    std::size_t pos = 0;
    while (pos <= content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos) end = content.size();
        auto line = trim(content.substr(pos, end - pos));
        pos = end + 1;

        if (line.empty()) continue;

        if (!seen_header) {
            // BOM tolerated before the header
            if (line.starts_with("\xEF\xBB\xBF")) line.remove_prefix(3);
            if (!line.starts_with(TAG_HEADER)) {
                return std::unexpected(make_error_code(core::TaskErrc::manifest_invalid));
            }
            seen_header = true;
            continue;
        }

        if (line[0] == '#') {
            if (line.starts_with(TAG_STREAM_INF)) {
                auto attrs = line.substr(TAG_STREAM_INF.size());
                variant = HLSVariant{};
                variant.bandwidth = to_number<std::uint64_t>(attribute(attrs, "BANDWIDTH"));
                variant.codecs = attribute(attrs, "CODECS");

                auto resolution = attribute(attrs, "RESOLUTION");
                if (auto x = resolution.find('x'); x != std::string::npos) {
                    variant.width = to_number<std::uint32_t>(std::string_view(resolution).substr(0, x));
                    variant.height = to_number<std::uint32_t>(std::string_view(resolution).substr(x + 1));
                }
                pending_variant = true;
            } else if (line.starts_with(TAG_EXTINF)) {
                auto val = line.substr(TAG_EXTINF.size());
                val = val.substr(0, val.find(','));
                playlist.total_duration += to_number<double>(val);
            } else if (line == TAG_ENDLIST) {
                playlist.has_endlist = true;
            }
            continue;
        }

        // URI line: belongs to the preceding STREAM-INF, or is a segment
        std::string url = base ? base->resolve(line) : std::string(line);
        if (pending_variant) {
            variant.url = std::move(url);
            playlist.variants.push_back(std::move(variant));
            pending_variant = false;
        } else {
            ++playlist.segment_count;
        }
    }

    if (!seen_header) {
        return std::unexpected(make_error_code(core::TaskErrc::manifest_invalid));
    }
    return playlist;
}

} // namespace ferry::media
