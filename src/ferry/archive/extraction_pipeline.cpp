// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/archive/extraction_pipeline.hpp>
#include <ferry/core/log.hpp>
#include <ferry/core/url.hpp>
#include <ferry/links/link_session.hpp>
#include <algorithm>

namespace ferry::archive {

namespace fs = std::filesystem;

namespace {

std::string lower_extension(const fs::path& file) {
    return core::to_lower(file.extension().string());
}

} // namespace

FileCategory categorize(const fs::path& file) {
    auto ext = lower_extension(file);
    if (is_video_file(file)) return FileCategory::video;
    if (ext == ".pdf") return FileCategory::pdf;
    if (ext == ".apk" || ext == ".xapk" || ext == ".apks") return FileCategory::apk;
    if (ext == ".txt") return FileCategory::txt;
    if (ext == ".m3u" || ext == ".m3u8") return FileCategory::m3u;
    return FileCategory::other;
}

bool is_video_file(const fs::path& file) {
    auto ext = lower_extension(file);
    return ext == ".mp4" || ext == ".mkv" || ext == ".mov" ||
           ext == ".avi" || ext == ".webm" || ext == ".ts";
}

ExtractionResult summarize_tree(const fs::path& base_dir) {
    ExtractionResult result;
    result.base_dir = base_dir;

    std::error_code ec;
    auto it = fs::recursive_directory_iterator(base_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return result;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;

        const auto& entry = *it;
        if (entry.is_directory(ec)) {
            ++result.stats.folders;
            continue;
        }
        if (!entry.is_regular_file(ec)) {
            continue;
        }

        ++result.stats.total_files;
        switch (categorize(entry.path())) {
            case FileCategory::video: ++result.stats.videos; break;
            case FileCategory::pdf:   ++result.stats.pdf; break;
            case FileCategory::apk:   ++result.stats.apk; break;
            case FileCategory::txt:   ++result.stats.txt; break;
            case FileCategory::m3u:   ++result.stats.m3u; break;
            case FileCategory::other: ++result.stats.others; break;
        }
        result.files.push_back(entry.path().lexically_relative(base_dir).generic_string());
    }

    std::sort(result.files.begin(), result.files.end(),
              [](const std::string& a, const std::string& b) {
                  auto la = core::to_lower(a);
                  auto lb = core::to_lower(b);
                  return la != lb ? la < lb : a < b;
              });
    return result;
}

links::LinkGroups scan_links_in_tree(const fs::path& base_dir,
                                     const links::LinkClassifier& classifier) {
    std::vector<std::string> found;

    std::error_code ec;
    auto it = fs::recursive_directory_iterator(base_dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;

        auto ext = lower_extension(it->path());
        if (ext != ".txt" && ext != ".m3u" && ext != ".m3u8") continue;

        auto text = links::read_text_document(it->path());
        if (!text) {
            // Unreadable files are skipped; the scan is informational only
            core::logger("archive")->debug("skip {}: {}", it->path().string(), text.error().message());
            continue;
        }
        auto urls = links::find_links(*text);
        found.insert(found.end(), urls.begin(), urls.end());
    }

    return classifier.group(found, /*dedupe=*/true);
}

//=============================================================================
// ExtractionPipeline
//=============================================================================

std::expected<bool, core::Failure>
ExtractionPipeline::detect_password_protected(const fs::path& archive) {
    auto encrypted = codec_.probe_encrypted(archive);
    if (encrypted && *encrypted) {
        core::logger("archive")->info("{} needs a password", archive.filename().string());
    }
    return encrypted;
}

std::expected<ExtractionResult, core::Failure>
ExtractionPipeline::extract(const fs::path& archive,
                            const fs::path& dest_dir,
                            const std::optional<std::string>& password,
                            const core::CancelToken& token) {
    auto log = core::logger("archive");

    if (auto ec = token.checkpoint()) {
        return std::unexpected(core::Failure(ec));
    }

    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        return std::unexpected(core::Failure(core::TaskErrc::resource_error,
                                             dest_dir.string() + ": " + ec.message()));
    }

    if (auto rc = codec_.extract(archive, dest_dir, password); !rc) {
        log->warn("extracting {} failed: {}", archive.filename().string(), rc.error().message());
        return std::unexpected(rc.error());
    }

    if (auto cancelled = token.checkpoint()) {
        return std::unexpected(core::Failure(cancelled));
    }

    auto result = summarize_tree(dest_dir);
    log->info("extracted {}: {} files in {} folders",
              archive.filename().string(), result.stats.total_files, result.stats.folders);
    return result;
}

} // namespace ferry::archive
