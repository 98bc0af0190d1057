// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/fetcher.hpp>
#include <ferry/core/task_coordinator.hpp>
#include <ferry/media/hls_parser.hpp>
#include <ferry/media/media_tool.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ferry::media {

using SelectionId = std::uint64_t;

// One selectable quality rendition
struct StreamVariant {
    std::string label;      // "720p", "800kbps", "Variant" or "Auto"
    std::string url;
};

// Pending quality choice for one manifest; consumed by a single choose()
struct StreamSelectionTask {
    SelectionId id{0};
    core::UserId owner{0};
    std::string manifest_url;
    std::vector<StreamVariant> variants;
    std::filesystem::path temp_dir;
    std::string base_name;
};

// Label for a master-playlist entry: height, else bandwidth, else "Variant"
[[nodiscard]] std::string variant_label(const HLSVariant& variant);

// URL tail without ".m3u8", or "stream"
[[nodiscard]] std::string manifest_base_name(std::string_view manifest_url);

class StreamVariantSelector {
public:
    StreamVariantSelector(core::Fetcher& fetcher, MediaTool& tool)
        : fetcher_(fetcher), tool_(tool) {}

    StreamVariantSelector(const StreamVariantSelector&) = delete;
    StreamVariantSelector& operator=(const StreamVariantSelector&) = delete;

    // Master playlist: one entry per sub-playlist in manifest order.
    // Leaf playlist: a single "Auto" entry pointing at `manifest_url`.
    [[nodiscard]] std::expected<std::vector<StreamVariant>, core::Failure>
    resolve_variants(const std::string& manifest_url);

    // Stream-copy `variant_url` into `dest`
    [[nodiscard]] std::expected<std::filesystem::path, core::Failure>
    materialize(const std::string& variant_url, const std::filesystem::path& dest);

    // Resolve and remember a selection task for `owner`
    [[nodiscard]] std::expected<StreamSelectionTask, core::Failure>
    offer(core::UserId owner, const std::string& manifest_url, const std::filesystem::path& temp_dir);

    // Materialize variant `index` of task `id`. The task is discarded after
    // the attempt, whether it succeeds or fails. A foreign requester or an
    // out-of-range index leaves it in place. Output goes to its own
    // temp_dir/selection_<id> directory.
    [[nodiscard]] std::expected<std::filesystem::path, core::Failure>
    choose(SelectionId id, std::size_t index, core::UserId requester);

    bool discard(SelectionId id);

    [[nodiscard]] std::optional<StreamSelectionTask> find(SelectionId id) const;
    [[nodiscard]] std::size_t pending() const;

private:
    core::Fetcher& fetcher_;
    MediaTool& tool_;

    std::unordered_map<SelectionId, StreamSelectionTask> tasks_;
    SelectionId next_id_{1};
    mutable std::mutex mutex_;
};

} // namespace ferry::media
