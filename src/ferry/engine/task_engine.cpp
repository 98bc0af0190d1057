// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/engine/task_engine.hpp>
#include <ferry/core/log.hpp>
#include <ferry/core/random_id.hpp>
#include <sstream>

namespace ferry::engine {

namespace fs = std::filesystem;

namespace {

links::ClassifierRules rules_from(const core::Settings& settings) {
    links::ClassifierRules rules;
    rules.cloud_drive_domain = settings.cloud_drive_domain;
    rules.platform_domains = settings.platform_domains;
    return rules;
}

double size_mb(const fs::path& file) {
    std::error_code ec;
    auto bytes = fs::file_size(file, ec);
    return ec ? 0.0 : static_cast<double>(bytes) / (1024.0 * 1024.0);
}

} // namespace

TaskEngine::TaskEngine(EngineContext ctx)
    : ctx_(std::move(ctx))
    , classifier_(rules_from(ctx_.settings))
    , extraction_(ctx_.codec)
    , selector_(ctx_.fetcher, ctx_.media)
    , batch_(ctx_.fetcher, selector_) {}

//=============================================================================
// Helpers
//=============================================================================

std::expected<core::Slot, core::Failure> TaskEngine::begin(core::UserId user) {
    ctx_.users.get_or_create_user(user);
    if (ctx_.users.is_banned(user)) {
        return std::unexpected(core::Failure(core::TaskErrc::banned));
    }

    auto slot = ctx_.coordinator.acquire(user);
    if (!slot) {
        return std::unexpected(core::Failure(slot.error()));
    }
    return std::move(*slot);
}

std::expected<fs::path, core::Failure> TaskEngine::make_scratch(core::UserId user) {
    auto root = ctx_.settings.temp_dir / std::to_string(user) / core::random_hex();

    auto ttl = ctx_.users.get_or_create_user(user).auto_delete_minutes;
    ctx_.registry.register_path(user, root, std::chrono::minutes(ttl));

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        core::logger("engine")->error("cannot create {}: {}", root.string(), ec.message());
        return std::unexpected(core::Failure(core::TaskErrc::resource_error,
                                             root.string() + ": " + ec.message()));
    }
    return root;
}

std::expected<void, core::Failure> TaskEngine::deliver(core::UserId user, const fs::path& file) {
    auto caption = file.filename().string();
    if (archive::is_video_file(file)) {
        return ctx_.messenger.deliver_video(user, file, caption);
    }
    return ctx_.messenger.deliver_document(user, file, caption);
}

std::optional<StatusId> TaskEngine::open_status(core::UserId user, const std::string& text) {
    auto status = ctx_.messenger.create_status(user, text);
    if (!status) {
        core::logger("engine")->debug("status unavailable: {}", status.error().message());
        return std::nullopt;
    }
    return *status;
}

void TaskEngine::status_text(const std::optional<StatusId>& status, const std::string& text) {
    if (!status) return;
    if (auto rc = ctx_.messenger.edit_status(*status, text); !rc) {
        core::logger("engine")->debug("status edit failed: {}", rc.error().message());
    }
}

void TaskEngine::status_failure(const std::optional<StatusId>& status, const core::Failure& failure) {
    if (failure.is(core::TaskErrc::cancelled)) {
        status_text(status, "Cancelled.");
        return;
    }
    status_text(status, failure.message());
}

std::expected<DeliveryTask, core::Failure>
TaskEngine::owned_delivery(core::UserId user, DeliveryId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deliveries_.find(id);
    if (it == deliveries_.end()) {
        return std::unexpected(core::Failure(core::TaskErrc::task_not_found));
    }
    if (it->second.owner != user) {
        return std::unexpected(core::Failure(core::TaskErrc::not_owner));
    }
    return it->second;
}

//=============================================================================
// Archive extraction
//=============================================================================

std::expected<ExtractionOutcome, core::Failure>
TaskEngine::extract_archive(core::UserId user,
                            const fs::path& archive,
                            const std::optional<std::string>& password) {
    auto slot = begin(user);
    if (!slot) {
        return std::unexpected(slot.error());
    }
    const auto& token = slot->token();
    auto log = core::logger("engine");

    // The inbound file is already local at this point
    if (auto ec = token.checkpoint()) {
        return std::unexpected(core::Failure(ec));
    }

    // Fail fast, before any scratch space exists
    if (!password || password->empty()) {
        auto encrypted = extraction_.detect_password_protected(archive);
        if (!encrypted) {
            return std::unexpected(encrypted.error());
        }
        if (*encrypted) {
            return std::unexpected(core::Failure(core::TaskErrc::password_required));
        }
    }

    auto scratch = make_scratch(user);
    if (!scratch) {
        return std::unexpected(scratch.error());
    }

    auto status = open_status(user, "Extracting " + archive.filename().string() + "...");

    auto result = extraction_.extract(archive, *scratch / "extracted", password, token);
    if (!result) {
        status_failure(status, result.error());
        return std::unexpected(result.error());
    }

    ExtractionOutcome outcome;
    outcome.links = archive::scan_links_in_tree(result->base_dir, classifier_);
    outcome.result = std::move(*result);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        DeliveryTask task;
        task.id = next_delivery_++;
        task.owner = user;
        task.base_dir = outcome.result.base_dir;
        task.files = outcome.result.files;
        outcome.delivery = task.id;
        deliveries_.emplace(task.id, std::move(task));
    }

    ctx_.users.record_task_stats(user, size_mb(archive));
    status_text(status, describe(outcome));
    log->info("user {}: extraction of {} ready as delivery #{}",
              user, archive.filename().string(), outcome.delivery);
    return outcome;
}

//=============================================================================
// Audio demux
//=============================================================================

std::expected<fs::path, core::Failure>
TaskEngine::extract_audio(core::UserId user, const fs::path& video) {
    auto slot = begin(user);
    if (!slot) {
        return std::unexpected(slot.error());
    }

    if (auto ec = slot->token().checkpoint()) {
        return std::unexpected(core::Failure(ec));
    }

    auto scratch = make_scratch(user);
    if (!scratch) {
        return std::unexpected(scratch.error());
    }

    auto status = open_status(user, "Extracting audio from " + video.filename().string() + "...");

    auto local = *scratch / video.filename();
    std::error_code ec;
    fs::copy_file(video, local, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        core::Failure failure(core::TaskErrc::resource_error, video.string() + ": " + ec.message());
        status_failure(status, failure);
        return std::unexpected(failure);
    }

    auto dest = *scratch / (video.stem().string() + ".m4a");
    auto audio = ctx_.media.demux_audio(local, dest);
    if (!audio) {
        status_failure(status, audio.error());
        return std::unexpected(audio.error());
    }

    if (auto ec2 = slot->token().checkpoint()) {
        status_failure(status, core::Failure(ec2));
        return std::unexpected(core::Failure(ec2));
    }

    if (auto sent = ctx_.messenger.deliver_document(user, *audio, audio->filename().string()); !sent) {
        status_failure(status, sent.error());
        return std::unexpected(sent.error());
    }

    ctx_.users.record_task_stats(user, size_mb(*audio));
    status_text(status, "Audio extracted: " + audio->filename().string());
    return *audio;
}

//=============================================================================
// Links
//=============================================================================

links::LinkBatch TaskEngine::remember_links(links::ChatId chat, links::MessageId message, std::string text) {
    auto batch = links::make_batch(std::move(text));
    sessions_.put(chat, message, batch);
    return batch;
}

std::expected<links::LinkBatch, core::Failure>
TaskEngine::remember_document(links::ChatId chat, links::MessageId message, const fs::path& file) {
    auto text = links::read_text_document(file);
    if (!text) {
        return std::unexpected(text.error());
    }
    return remember_links(chat, message, std::move(*text));
}

std::expected<std::string, core::Failure>
TaskEngine::clean_links(links::ChatId chat, links::MessageId message) const {
    auto batch = sessions_.get(chat, message);
    if (!batch) {
        return std::unexpected(core::Failure(core::TaskErrc::task_not_found));
    }
    return links::clean_links(*batch);
}

std::expected<pipeline::BatchResult, core::Failure>
TaskEngine::download_links(core::UserId user, links::ChatId chat, links::MessageId message) {
    auto batch = sessions_.get(chat, message);
    if (!batch) {
        return std::unexpected(core::Failure(core::TaskErrc::task_not_found));
    }
    if (batch->extracted_urls.empty()) {
        return std::unexpected(core::Failure(core::TaskErrc::no_links));
    }

    auto groups = classifier_.group(batch->extracted_urls, /*dedupe=*/false);
    if (pipeline::BatchDownloadPipeline::fetch_candidates(groups) == 0 &&
        groups.streaming_manifest.empty()) {
        return std::unexpected(core::Failure(core::TaskErrc::no_links));
    }

    auto slot = begin(user);
    if (!slot) {
        return std::unexpected(slot.error());
    }

    auto scratch = make_scratch(user);
    if (!scratch) {
        return std::unexpected(scratch.error());
    }

    auto status = open_status(user, "Downloading " + std::to_string(groups.total()) + " links...");
    if (status) {
        if (auto rc = ctx_.messenger.pin_status(*status); !rc) {
            core::logger("engine")->debug("pin failed: {}", rc.error().message());
        }
    }

    std::string current_label;
    pipeline::BatchHooks hooks;
    hooks.on_item = [&](std::size_t index, std::size_t count, const std::string& url) {
        current_label = "[" + std::to_string(index) + "/" + std::to_string(count) + "] " + url;
        status_text(status, current_label);
    };
    hooks.on_progress = [&](const core::ProgressSample& sample) {
        if (!status) return;
        if (auto rc = ctx_.messenger.report_progress(*status, current_label, sample); !rc) {
            core::logger("engine")->debug("progress update failed: {}", rc.error().message());
        }
    };
    hooks.on_file = [this, user](const fs::path& file) {
        return deliver(user, file);
    };

    pipeline::BatchOptions options;
    options.dest_dir = *scratch;
    options.progress_interval = ctx_.settings.progress_interval;

    auto result = batch_.run(user, groups, options, slot->token(), hooks);

    if (status) {
        if (auto rc = ctx_.messenger.unpin_status(*status); !rc) {
            core::logger("engine")->debug("unpin failed: {}", rc.error().message());
        }
    }

    if (!result) {
        status_failure(status, result.error());
        return std::unexpected(result.error());
    }

    if (result->ok > 0) {
        double total_mb = 0.0;
        for (const auto& file : result->files) {
            total_mb += size_mb(file);
        }
        ctx_.users.record_task_stats(user, total_mb);
    }
    status_text(status, describe(*result));
    return result;
}

//=============================================================================
// Streaming manifests
//=============================================================================

std::expected<media::StreamSelectionTask, core::Failure>
TaskEngine::offer_stream(core::UserId user, const std::string& manifest_url) {
    auto slot = begin(user);
    if (!slot) {
        return std::unexpected(slot.error());
    }

    auto scratch = make_scratch(user);
    if (!scratch) {
        return std::unexpected(scratch.error());
    }
    return selector_.offer(user, manifest_url, *scratch);
}

std::expected<fs::path, core::Failure>
TaskEngine::choose_variant(core::UserId user, media::SelectionId selection, std::size_t index) {
    auto slot = begin(user);
    if (!slot) {
        return std::unexpected(slot.error());
    }

    // The choice writes into the offer's scratch directory; once that has been
    // swept the selection is dead. A live one gets a fresh lease for the remux.
    if (auto pending = selector_.find(selection); pending && pending->owner == user) {
        if (!ctx_.registry.tracks(pending->temp_dir)) {
            selector_.discard(selection);
            core::logger("engine")->info("selection {} expired with {}", selection, pending->temp_dir.string());
            return std::unexpected(core::Failure(core::TaskErrc::task_not_found, "selection expired"));
        }
        auto ttl = ctx_.users.get_or_create_user(user).auto_delete_minutes;
        ctx_.registry.register_path(user, pending->temp_dir, std::chrono::minutes(ttl));
    }

    auto status = open_status(user, "Downloading stream...");

    auto file = selector_.choose(selection, index, user);
    if (!file) {
        status_failure(status, file.error());
        return std::unexpected(file.error());
    }

    if (auto sent = deliver(user, *file); !sent) {
        status_failure(status, sent.error());
        return std::unexpected(sent.error());
    }

    ctx_.users.record_task_stats(user, size_mb(*file));
    status_text(status, "Stream saved: " + file->filename().string());
    return file;
}

//=============================================================================
// Delivery
//=============================================================================

std::expected<SendReport, core::Failure>
TaskEngine::send_all(core::UserId user, DeliveryId delivery) {
    auto task = owned_delivery(user, delivery);
    if (!task) {
        return std::unexpected(task.error());
    }

    auto slot = begin(user);
    if (!slot) {
        return std::unexpected(slot.error());
    }

    auto status = open_status(user, "Sending " + std::to_string(task->files.size()) + " files...");
    if (status) {
        if (auto rc = ctx_.messenger.pin_status(*status); !rc) {
            core::logger("engine")->debug("pin failed: {}", rc.error().message());
        }
    }

    SendReport report;
    for (const auto& rel : task->files) {
        if (slot->token().cancelled()) {
            report.cancelled = true;
            break;
        }

        auto path = task->base_dir / rel;
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            ++report.missing;
            continue;
        }

        if (auto sent = deliver(user, path); sent) {
            ++report.sent;
        } else {
            ++report.failed;
            core::logger("engine")->warn("send {} failed: {}", rel, sent.error().message());
        }
    }

    if (status) {
        if (auto rc = ctx_.messenger.unpin_status(*status); !rc) {
            core::logger("engine")->debug("unpin failed: {}", rc.error().message());
        }
    }
    status_text(status, report.cancelled
        ? "Cancelled after " + std::to_string(report.sent) + " files."
        : "Sent " + std::to_string(report.sent) + " files.");
    return report;
}

std::expected<void, core::Failure>
TaskEngine::send_one(core::UserId user, DeliveryId delivery, std::size_t index) {
    auto task = owned_delivery(user, delivery);
    if (!task) {
        return std::unexpected(task.error());
    }
    if (index >= task->files.size()) {
        return std::unexpected(core::Failure(core::TaskErrc::invalid_index));
    }

    auto path = task->base_dir / task->files[index];
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(core::Failure(core::TaskErrc::task_not_found, task->files[index]));
    }
    return deliver(user, path);
}

std::expected<void, core::Failure> TaskEngine::discard(core::UserId user, DeliveryId delivery) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deliveries_.find(delivery);
    if (it == deliveries_.end()) {
        return std::unexpected(core::Failure(core::TaskErrc::task_not_found));
    }
    if (it->second.owner != user) {
        return std::unexpected(core::Failure(core::TaskErrc::not_owner));
    }
    deliveries_.erase(it);
    return {};
}

bool TaskEngine::cancel(core::UserId user) {
    return ctx_.coordinator.request_cancel(user);
}

std::optional<DeliveryTask> TaskEngine::delivery(DeliveryId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deliveries_.find(id);
    if (it == deliveries_.end()) return std::nullopt;
    return it->second;
}

//=============================================================================
// Summaries
//=============================================================================

std::string describe(const ExtractionOutcome& outcome) {
    const auto& s = outcome.result.stats;
    const auto& l = outcome.links;

    std::ostringstream ss;
    ss << "Extraction done\n"
       << "Total files: " << s.total_files << "\n"
       << "Folders: " << s.folders << "\n"
       << "Videos: " << s.videos << " | PDFs: " << s.pdf << " | APK: " << s.apk << "\n"
       << "TXT: " << s.txt << " | M3U/M3U8: " << s.m3u << " | Others: " << s.others << "\n"
       << "Links inside archive:\n"
       << "  Direct: " << l.direct.size() + l.unknown.size() << "\n"
       << "  m3u8: " << l.streaming_manifest.size() << "\n"
       << "  Cloud drive: " << l.cloud_drive.size() << "\n"
       << "  Platform: " << l.platform_internal.size();
    return ss.str();
}

std::string describe(const pipeline::BatchResult& result) {
    std::ostringstream ss;
    ss << "Downloads finished. Success: " << result.ok << " | Failed: " << result.fail;
    if (!result.selections.empty()) {
        ss << " | Streams awaiting quality choice: " << result.selections.size();
    }
    if (result.cancelled) {
        ss << " (cancelled)";
    }
    return ss.str();
}

} // namespace ferry::engine
