// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/links/link_classifier.hpp>
#include <ferry/core/url.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>

namespace ferry::links {

namespace {

constexpr std::array<std::string_view, 27> DIRECT_EXTENSIONS = {
    // Video
    ".mp4", ".mkv", ".mov", ".avi", ".webm", ".ts",
    // Archive
    ".zip", ".rar", ".7z", ".tar", ".gz", ".tgz", ".tar.gz", ".tar.bz2", ".tbz2", ".bz2", ".xz",
    // Audio
    ".mp3", ".m4a", ".aac", ".ogg", ".opus", ".flac", ".wav",
    // Packages
    ".apk", ".xapk", ".apks",
};

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool starts_with_nocase(std::string_view text, std::size_t pos, std::string_view prefix) noexcept {
    if (text.size() - pos < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[pos + i])) != prefix[i]) return false;
    }
    return true;
}

// Length of "https://" or "http://" at pos, 0 when neither
std::size_t scheme_length_at(std::string_view text, std::size_t pos) noexcept {
    if (starts_with_nocase(text, pos, "https://")) return 8;
    if (starts_with_nocase(text, pos, "http://")) return 7;
    return 0;
}

bool host_matches(std::string_view host, std::string_view domain) noexcept {
    if (domain.empty()) return false;
    if (host == domain) return true;
    return host.size() > domain.size() &&
           host.ends_with(domain) &&
           host[host.size() - domain.size() - 1] == '.';
}

// Host of `url`, lowercased; empty when the URL does not parse
std::string host_of(std::string_view url) {
    auto parsed = core::Url::parse(url);
    return parsed ? std::string(parsed->host()) : std::string{};
}

} // namespace

std::string_view to_string(LinkKind kind) noexcept {
    switch (kind) {
        case LinkKind::cloud_drive:        return "cloud_drive";
        case LinkKind::platform_internal:  return "platform_internal";
        case LinkKind::streaming_manifest: return "streaming_manifest";
        case LinkKind::direct:             return "direct";
        case LinkKind::unknown:            return "unknown";
    }
    return "unknown";
}

//=============================================================================
// LinkGroups
//=============================================================================

std::vector<std::string>& LinkGroups::bucket(LinkKind kind) noexcept {
    switch (kind) {
        case LinkKind::cloud_drive:        return cloud_drive;
        case LinkKind::platform_internal:  return platform_internal;
        case LinkKind::streaming_manifest: return streaming_manifest;
        case LinkKind::direct:             return direct;
        case LinkKind::unknown:            return unknown;
    }
    return unknown;
}

const std::vector<std::string>& LinkGroups::bucket(LinkKind kind) const noexcept {
    return const_cast<LinkGroups*>(this)->bucket(kind);
}

std::size_t LinkGroups::total() const noexcept {
    return cloud_drive.size() + platform_internal.size() + streaming_manifest.size() +
           direct.size() + unknown.size();
}

//=============================================================================
// LinkClassifier
//=============================================================================

LinkKind LinkClassifier::classify(std::string_view url) const {
    auto host = host_of(url);
    auto lower = core::to_lower(url);

    if (!rules_.cloud_drive_domain.empty()) {
        // A URL that does not parse still counts when the domain appears in it
        std::string_view haystack = host.empty() ? std::string_view(lower) : std::string_view(host);
        if (haystack.find(rules_.cloud_drive_domain) != std::string_view::npos) {
            return LinkKind::cloud_drive;
        }
    }

    for (const auto& domain : rules_.platform_domains) {
        if (host_matches(host, domain)) {
            return LinkKind::platform_internal;
        }
    }

    auto base = core::strip_query_and_fragment(lower);
    if (base.ends_with(".m3u8")) {
        return LinkKind::streaming_manifest;
    }
    if (has_direct_extension(url)) {
        return LinkKind::direct;
    }
    return LinkKind::unknown;
}

LinkGroups LinkClassifier::group(const std::vector<std::string>& urls, bool dedupe) const {
    LinkGroups groups;
    std::unordered_set<std::string> seen;

    for (const auto& url : urls) {
        auto kind = classify(url);
        if (dedupe) {
            // Per-category: the same URL always lands in the same bucket
            if (!seen.insert(url).second) continue;
        }
        groups.bucket(kind).push_back(url);
    }
    return groups;
}

//=============================================================================
// Free functions
//=============================================================================

std::vector<std::string> find_links(std::string_view text) {
    std::vector<std::string> links;

    std::size_t pos = 0;
    while (pos < text.size()) {
        auto scheme_len = scheme_length_at(text, pos);
        if (scheme_len == 0) {
            ++pos;
            continue;
        }

        auto end = pos + scheme_len;
        while (end < text.size() && !is_space(text[end])) {
            ++end;
        }
        if (end == pos + scheme_len) {
            // Bare scheme with nothing after it
            ++pos;
            continue;
        }

        std::string link(text.substr(pos, end - pos));
        while (!link.empty() && (link.back() == '.' || link.back() == ',' || link.back() == ')')) {
            link.pop_back();
        }
        if (!link.empty()) {
            links.push_back(std::move(link));
        }
        pos = end;
    }
    return links;
}

bool has_direct_extension(std::string_view url) {
    auto lower = core::to_lower(url);
    auto base = core::strip_query_and_fragment(lower);

    return std::any_of(DIRECT_EXTENSIONS.begin(), DIRECT_EXTENSIONS.end(),
                       [base](std::string_view ext) { return base.ends_with(ext); });
}

std::optional<std::string> drive_direct_url(std::string_view url) {
    auto parsed = core::Url::parse(url);
    if (!parsed) return std::nullopt;

    std::string id;
    auto path = parsed->path();

    // /file/d/<id>/view
    constexpr std::string_view file_prefix = "/file/d/";
    if (auto pos = path.find(file_prefix); pos != std::string_view::npos) {
        auto rest = path.substr(pos + file_prefix.size());
        id = std::string(rest.substr(0, rest.find('/')));
    } else if (path == "/open" || path == "/uc") {
        id = parsed->query_param("id");
    }

    if (id.empty()) return std::nullopt;
    return std::string(core::CLOUD_DRIVE_DOWNLOAD) + id;
}

} // namespace ferry::links
