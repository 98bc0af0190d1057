// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/media/variant_selector.hpp>
#include <ferry/core/log.hpp>
#include <ferry/core/url.hpp>

namespace ferry::media {

namespace fs = std::filesystem;

std::string variant_label(const HLSVariant& variant) {
    if (variant.height > 0) {
        return std::to_string(variant.height) + "p";
    }
    if (variant.bandwidth > 0) {
        return std::to_string(variant.bandwidth / 1000) + "kbps";
    }
    return "Variant";
}

std::string manifest_base_name(std::string_view manifest_url) {
    std::string name;
    if (auto url = core::Url::parse(manifest_url)) {
        name = url->path_tail();
    }
    if (name.size() > 5 && core::to_lower(name.substr(name.size() - 5)) == ".m3u8") {
        name.resize(name.size() - 5);
    }
    // Path separators or an empty tail cannot name a file
    if (name.empty() || name.find_first_of("/\\") != std::string::npos) {
        return "stream";
    }
    return name;
}

std::expected<std::vector<StreamVariant>, core::Failure>
StreamVariantSelector::resolve_variants(const std::string& manifest_url) {
    auto text = fetcher_.fetch_text(manifest_url);
    if (!text) {
        return std::unexpected(text.error());
    }

    auto playlist = HLSParser::parse(*text, manifest_url);
    if (!playlist) {
        return std::unexpected(core::Failure(playlist.error(), manifest_url));
    }

    std::vector<StreamVariant> variants;
    if (!playlist->is_master()) {
        variants.push_back({"Auto", manifest_url});
        return variants;
    }

    variants.reserve(playlist->variants.size());
    for (const auto& v : playlist->variants) {
        variants.push_back({variant_label(v), v.url});
    }
    core::logger("media")->debug("{}: {} variants", manifest_url, variants.size());
    return variants;
}

std::expected<fs::path, core::Failure>
StreamVariantSelector::materialize(const std::string& variant_url, const fs::path& dest) {
    return tool_.remux_stream_copy(variant_url, dest);
}

std::expected<StreamSelectionTask, core::Failure>
StreamVariantSelector::offer(core::UserId owner, const std::string& manifest_url, const fs::path& temp_dir) {
    auto variants = resolve_variants(manifest_url);
    if (!variants) {
        return std::unexpected(variants.error());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    StreamSelectionTask task;
    task.id = next_id_++;
    task.owner = owner;
    task.manifest_url = manifest_url;
    task.variants = std::move(*variants);
    task.temp_dir = temp_dir;
    task.base_name = manifest_base_name(manifest_url);
    tasks_[task.id] = task;
    return task;
}

std::expected<fs::path, core::Failure>
StreamVariantSelector::choose(SelectionId id, std::size_t index, core::UserId requester) {
    StreamSelectionTask task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return std::unexpected(core::Failure(core::TaskErrc::task_not_found));
        }
        if (it->second.owner != requester) {
            return std::unexpected(core::Failure(core::TaskErrc::not_owner));
        }
        if (index >= it->second.variants.size()) {
            return std::unexpected(core::Failure(core::TaskErrc::invalid_index));
        }
        // Single shot: gone before the remux starts so a second choice cannot race it
        task = std::move(it->second);
        tasks_.erase(it);
    }

    const auto& variant = task.variants[index];
    // Manifests sharing a tail and a temp dir must not overwrite each other
    auto out_dir = task.temp_dir / ("selection_" + std::to_string(task.id));
    auto dest = out_dir / (task.base_name + "_" + variant.label + ".mp4");

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        return std::unexpected(core::Failure(core::TaskErrc::resource_error,
                                             out_dir.string() + ": " + ec.message()));
    }

    core::logger("media")->info("remux {} ({}) -> {}", task.manifest_url, variant.label, dest.string());
    return materialize(variant.url, dest);
}

bool StreamVariantSelector::discard(SelectionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.erase(id) > 0;
}

std::optional<StreamSelectionTask> StreamVariantSelector::find(SelectionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::size_t StreamVariantSelector::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace ferry::media
