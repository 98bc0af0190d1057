// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/fetcher.hpp>
#include <ferry/core/progress.hpp>
#include <ferry/core/task_coordinator.hpp>
#include <ferry/links/link_classifier.hpp>
#include <ferry/media/variant_selector.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace ferry::pipeline {

// Per-item callbacks. All optional.
struct BatchHooks {
    // Before each fetch: 1-based position, number of fetch candidates, URL
    std::function<void(std::size_t, std::size_t, const std::string&)> on_item;

    // Rate-limited byte progress of the current item
    core::ProgressSink on_progress;

    // Hand off a downloaded file; an error counts the item as failed
    std::function<std::expected<void, core::Failure>(const std::filesystem::path&)> on_file;

    // A manifest turned into a pending quality choice
    std::function<void(const media::StreamSelectionTask&)> on_selection;
};

struct BatchItemFailure {
    std::string url;
    core::Failure failure;
};

struct BatchResult {
    std::uint32_t ok{0};
    std::uint32_t fail{0};
    bool cancelled{false};

    std::vector<std::filesystem::path> files;
    std::vector<BatchItemFailure> failures;
    std::vector<media::StreamSelectionTask> selections;
    std::vector<BatchItemFailure> manifest_failures;
    std::uint32_t skipped_internal{0};      // Platform links are never fetched
};

struct BatchOptions {
    std::filesystem::path dest_dir;
    std::chrono::milliseconds progress_interval{core::PROGRESS_INTERVAL};
};

// Sequential batch fetcher. Order: cloud-drive links (rewritten to a direct
// URL first), then direct and unknown links, then manifests. One failing
// item never stops the batch; the token is checked before every item.
class BatchDownloadPipeline {
public:
    BatchDownloadPipeline(core::Fetcher& fetcher, media::StreamVariantSelector& selector)
        : fetcher_(fetcher), selector_(selector) {}

    // Fails with no_links when the groups hold nothing fetchable
    [[nodiscard]] std::expected<BatchResult, core::Failure>
    run(core::UserId owner,
        const links::LinkGroups& groups,
        const BatchOptions& options,
        const core::CancelToken& token,
        const BatchHooks& hooks = {});

    // Number of items run() would fetch (drive + direct + unknown)
    [[nodiscard]] static std::size_t fetch_candidates(const links::LinkGroups& groups) noexcept;

private:
    [[nodiscard]] std::expected<std::filesystem::path, core::Failure>
    fetch_one(const std::string& url,
              const std::string& fallback_name,
              const BatchOptions& options,
              const BatchHooks& hooks);

    core::Fetcher& fetcher_;
    media::StreamVariantSelector& selector_;
};

} // namespace ferry::pipeline
