// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/pipeline/batch_download.hpp>
#include <ferry/core/log.hpp>
#include <optional>

namespace ferry::pipeline {

namespace fs = std::filesystem;

namespace {

struct Candidate {
    std::string url;            // As received, for reporting
    std::string fetch_url;      // Empty when the link could not be rewritten
    std::string fallback_name;
};

} // namespace

std::size_t BatchDownloadPipeline::fetch_candidates(const links::LinkGroups& groups) noexcept {
    return groups.cloud_drive.size() + groups.direct.size() + groups.unknown.size();
}

std::expected<fs::path, core::Failure>
BatchDownloadPipeline::fetch_one(const std::string& url,
                                 const std::string& fallback_name,
                                 const BatchOptions& options,
                                 const BatchHooks& hooks) {
    core::DownloadRequest request;
    request.url = url;
    request.dest_dir = options.dest_dir;
    request.fallback_name = fallback_name;

    core::ProgressFn progress;
    std::optional<core::ProgressReporter> reporter;
    if (hooks.on_progress) {
        reporter.emplace(hooks.on_progress, options.progress_interval);
        progress = reporter->as_callback();
    }

    return fetcher_.download(request, progress);
}

std::expected<BatchResult, core::Failure>
BatchDownloadPipeline::run(core::UserId owner,
                           const links::LinkGroups& groups,
                           const BatchOptions& options,
                           const core::CancelToken& token,
                           const BatchHooks& hooks) {
    auto log = core::logger("batch");

    if (fetch_candidates(groups) == 0 && groups.streaming_manifest.empty()) {
        return std::unexpected(core::Failure(core::TaskErrc::no_links));
    }

    BatchResult result;
    result.skipped_internal = static_cast<std::uint32_t>(groups.platform_internal.size());

    std::vector<Candidate> candidates;
    candidates.reserve(fetch_candidates(groups));
    for (const auto& url : groups.cloud_drive) {
        auto direct = links::drive_direct_url(url);
        candidates.push_back({url, direct.value_or(""), "drive_file"});
    }
    for (const auto& url : groups.direct) {
        candidates.push_back({url, url, {}});
    }
    for (const auto& url : groups.unknown) {
        candidates.push_back({url, url, {}});
    }

    log->info("user {}: {} fetches, {} manifests, {} internal links skipped",
              owner, candidates.size(), groups.streaming_manifest.size(), result.skipped_internal);

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (token.cancelled()) {
            result.cancelled = true;
            break;
        }

        const auto& item = candidates[i];
        if (hooks.on_item) {
            hooks.on_item(i + 1, candidates.size(), item.url);
        }

        if (item.fetch_url.empty()) {
            // Unresolvable drive links fail without touching the network
            ++result.fail;
            result.failures.push_back({item.url, core::Failure(core::TaskErrc::unresolvable_link)});
            log->warn("cannot resolve {}", item.url);
            continue;
        }

        auto file = fetch_one(item.fetch_url, item.fallback_name, options, hooks);
        if (file && hooks.on_file) {
            if (auto delivered = hooks.on_file(*file); !delivered) {
                file = std::unexpected(delivered.error());
            }
        }

        if (file) {
            ++result.ok;
            result.files.push_back(*file);
            log->debug("fetched {} -> {}", item.url, file->string());
        } else {
            ++result.fail;
            log->warn("{} failed: {}", item.url, file.error().message());
            result.failures.push_back({item.url, file.error()});
        }
    }

    for (const auto& url : groups.streaming_manifest) {
        if (token.cancelled()) {
            result.cancelled = true;
            break;
        }

        auto task = selector_.offer(owner, url, options.dest_dir);
        if (!task) {
            log->warn("manifest {} failed: {}", url, task.error().message());
            result.manifest_failures.push_back({url, task.error()});
            continue;
        }
        if (hooks.on_selection) {
            hooks.on_selection(*task);
        }
        result.selections.push_back(std::move(*task));
    }

    log->info("user {}: batch done, ok {} fail {}{}", owner, result.ok, result.fail,
              result.cancelled ? " (cancelled)" : "");
    return result;
}

} // namespace ferry::pipeline
