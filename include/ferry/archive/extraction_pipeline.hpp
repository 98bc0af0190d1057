// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/archive/archive_codec.hpp>
#include <ferry/core/task_coordinator.hpp>
#include <ferry/links/link_classifier.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::archive {

enum class FileCategory : std::uint8_t {
    video,
    pdf,
    apk,
    txt,
    m3u,
    other,
};

[[nodiscard]] FileCategory categorize(const std::filesystem::path& file);

// Video extensions delivered as playable media
[[nodiscard]] bool is_video_file(const std::filesystem::path& file);

// Aggregate counts; the per-category fields always sum to total_files
struct ExtractionStats {
    std::uint32_t total_files{0};
    std::uint32_t folders{0};
    std::uint32_t videos{0};
    std::uint32_t pdf{0};
    std::uint32_t apk{0};
    std::uint32_t txt{0};
    std::uint32_t m3u{0};
    std::uint32_t others{0};

    [[nodiscard]] std::uint32_t category_sum() const noexcept {
        return videos + pdf + apk + txt + m3u + others;
    }
};

struct ExtractionResult {
    ExtractionStats stats;
    std::vector<std::string> files;         // Relative paths, case-insensitive order
    std::filesystem::path base_dir;
};

// Walk `base_dir` and build stats plus the sorted listing
[[nodiscard]] ExtractionResult summarize_tree(const std::filesystem::path& base_dir);

// Scan .txt/.m3u/.m3u8 files under `base_dir` for links, deduplicated per category
[[nodiscard]] links::LinkGroups scan_links_in_tree(const std::filesystem::path& base_dir,
                                                   const links::LinkClassifier& classifier);

// Unpacks one archive through the codec and describes the result
class ExtractionPipeline {
public:
    explicit ExtractionPipeline(ArchiveCodec& codec) : codec_(codec) {}

    [[nodiscard]] std::expected<bool, core::Failure>
    detect_password_protected(const std::filesystem::path& archive);

    // Fail-fast probe, meant to run before any scratch space is allocated
    // Checks `token` before and after the codec call; the codec call itself
    // runs to completion. A bad or missing password surfaces as wrong_password.
    [[nodiscard]] std::expected<ExtractionResult, core::Failure>
    extract(const std::filesystem::path& archive,
            const std::filesystem::path& dest_dir,
            const std::optional<std::string>& password,
            const core::CancelToken& token = {});

private:
    ArchiveCodec& codec_;
};

} // namespace ferry::archive
