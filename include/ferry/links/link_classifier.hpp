// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::links {

enum class LinkKind : std::uint8_t {
    cloud_drive,
    platform_internal,
    streaming_manifest,
    direct,
    unknown,            // Callers treat it as a direct candidate
};

[[nodiscard]] std::string_view to_string(LinkKind kind) noexcept;

// Links bucketed by kind, each in first-seen order
struct LinkGroups {
    std::vector<std::string> cloud_drive;
    std::vector<std::string> platform_internal;
    std::vector<std::string> streaming_manifest;
    std::vector<std::string> direct;
    std::vector<std::string> unknown;

    [[nodiscard]] std::vector<std::string>& bucket(LinkKind kind) noexcept;
    [[nodiscard]] const std::vector<std::string>& bucket(LinkKind kind) const noexcept;

    [[nodiscard]] std::size_t total() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return total() == 0; }
};

// Domains that decide the first two precedence rules
struct ClassifierRules {
    std::string cloud_drive_domain{std::string(core::CLOUD_DRIVE_DOMAIN)};
    std::vector<std::string> platform_domains{"t.me", "telegram.me"};
};

class LinkClassifier {
public:
    LinkClassifier() = default;
    explicit LinkClassifier(ClassifierRules rules) : rules_(std::move(rules)) {}

    // Precedence: cloud drive host, platform host, .m3u8 path,
    // known file extension, otherwise unknown. Total over any input.
    [[nodiscard]] LinkKind classify(std::string_view url) const;

    // Bucket `urls`; with `dedupe` each bucket keeps first occurrences only
    [[nodiscard]] LinkGroups group(const std::vector<std::string>& urls, bool dedupe) const;

    [[nodiscard]] const ClassifierRules& rules() const noexcept { return rules_; }

private:
    ClassifierRules rules_;
};

// Greedy http(s) URL scan; trailing '.', ',' and ')' are trimmed.
// Order and duplicates are preserved.
[[nodiscard]] std::vector<std::string> find_links(std::string_view text);

// Path (query and fragment ignored) ends with a known media, archive or package extension
[[nodiscard]] bool has_direct_extension(std::string_view url);

// Rewrite a cloud-drive share link to its direct download form
[[nodiscard]] std::optional<std::string> drive_direct_url(std::string_view url);

} // namespace ferry::links
