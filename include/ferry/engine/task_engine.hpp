// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/archive/archive_codec.hpp>
#include <ferry/archive/extraction_pipeline.hpp>
#include <ferry/core/fetcher.hpp>
#include <ferry/core/resource_registry.hpp>
#include <ferry/core/settings.hpp>
#include <ferry/core/task_coordinator.hpp>
#include <ferry/core/user_store.hpp>
#include <ferry/engine/messenger.hpp>
#include <ferry/links/link_classifier.hpp>
#include <ferry/links/link_session.hpp>
#include <ferry/media/media_tool.hpp>
#include <ferry/media/variant_selector.hpp>
#include <ferry/pipeline/batch_download.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ferry::engine {

using DeliveryId = std::uint64_t;

// Extracted files awaiting "send all" / "send one"
struct DeliveryTask {
    DeliveryId id{0};
    core::UserId owner{0};
    std::filesystem::path base_dir;
    std::vector<std::string> files;
};

struct ExtractionOutcome {
    archive::ExtractionResult result;
    links::LinkGroups links;            // Found inside the archive, informational
    DeliveryId delivery{0};
};

struct SendReport {
    std::uint32_t sent{0};
    std::uint32_t failed{0};
    std::uint32_t missing{0};           // Already swept or removed
    bool cancelled{false};
};

// External collaborators and shared state the engine works against
struct EngineContext {
    core::Settings settings;
    core::TaskCoordinator& coordinator;
    core::ResourceRegistry& registry;
    core::UserStore& users;
    core::Fetcher& fetcher;
    archive::ArchiveCodec& codec;
    media::MediaTool& media;
    Messenger& messenger;
};

// Entry point for every user-triggered job. Each heavyweight operation
// holds the user's slot for its whole duration and releases it on every
// exit path; scratch space is registered with the registry before the
// first byte is written to it.
class TaskEngine {
public:
    explicit TaskEngine(EngineContext ctx);

    TaskEngine(const TaskEngine&) = delete;
    TaskEngine& operator=(const TaskEngine&) = delete;

    // Unpack an archive into a fresh scratch dir and remember the listing
    [[nodiscard]] std::expected<ExtractionOutcome, core::Failure>
    extract_archive(core::UserId user,
                    const std::filesystem::path& archive,
                    const std::optional<std::string>& password = std::nullopt);

    // Copy the audio track of a video to <base>.m4a and deliver it
    [[nodiscard]] std::expected<std::filesystem::path, core::Failure>
    extract_audio(core::UserId user, const std::filesystem::path& video);

    // Parse and remember links of an inbound message
    links::LinkBatch remember_links(links::ChatId chat, links::MessageId message, std::string text);

    // Same for an uploaded .txt document
    [[nodiscard]] std::expected<links::LinkBatch, core::Failure>
    remember_document(links::ChatId chat, links::MessageId message, const std::filesystem::path& file);

    // "Clean text" view of a remembered batch
    [[nodiscard]] std::expected<std::string, core::Failure>
    clean_links(links::ChatId chat, links::MessageId message) const;

    // Fetch every link of a remembered batch, delivering files as they land
    [[nodiscard]] std::expected<pipeline::BatchResult, core::Failure>
    download_links(core::UserId user, links::ChatId chat, links::MessageId message);

    // Resolve one manifest into a pending quality choice
    [[nodiscard]] std::expected<media::StreamSelectionTask, core::Failure>
    offer_stream(core::UserId user, const std::string& manifest_url);

    // Materialize and deliver the chosen variant; the selection is consumed.
    // task_not_found once the offer's scratch directory has been swept.
    [[nodiscard]] std::expected<std::filesystem::path, core::Failure>
    choose_variant(core::UserId user, media::SelectionId selection, std::size_t index);

    [[nodiscard]] std::expected<SendReport, core::Failure>
    send_all(core::UserId user, DeliveryId delivery);

    [[nodiscard]] std::expected<void, core::Failure>
    send_one(core::UserId user, DeliveryId delivery, std::size_t index);

    // Drop a delivery task ("cancel session")
    [[nodiscard]] std::expected<void, core::Failure>
    discard(core::UserId user, DeliveryId delivery);

    // Flag the user's running task; false when nothing runs
    bool cancel(core::UserId user);

    [[nodiscard]] std::optional<DeliveryTask> delivery(DeliveryId id) const;

    [[nodiscard]] const links::LinkClassifier& classifier() const noexcept { return classifier_; }
    [[nodiscard]] media::StreamVariantSelector& selector() noexcept { return selector_; }

private:
    // Banned check plus slot acquisition
    [[nodiscard]] std::expected<core::Slot, core::Failure> begin(core::UserId user);

    // <temp_dir>/<user>/<random>, registered before creation
    [[nodiscard]] std::expected<std::filesystem::path, core::Failure> make_scratch(core::UserId user);

    [[nodiscard]] std::expected<void, core::Failure>
    deliver(core::UserId user, const std::filesystem::path& file);

    [[nodiscard]] std::expected<DeliveryTask, core::Failure>
    owned_delivery(core::UserId user, DeliveryId id) const;

    void status_text(const std::optional<StatusId>& status, const std::string& text);
    void status_failure(const std::optional<StatusId>& status, const core::Failure& failure);
    [[nodiscard]] std::optional<StatusId> open_status(core::UserId user, const std::string& text);

    EngineContext ctx_;
    links::LinkClassifier classifier_;
    links::LinkSessionStore sessions_;
    archive::ExtractionPipeline extraction_;
    media::StreamVariantSelector selector_;
    pipeline::BatchDownloadPipeline batch_;

    std::unordered_map<DeliveryId, DeliveryTask> deliveries_;
    DeliveryId next_delivery_{1};
    mutable std::mutex mutex_;
};

// Summary lines shown after an extraction
[[nodiscard]] std::string describe(const ExtractionOutcome& outcome);

// One-line totals of a finished batch
[[nodiscard]] std::string describe(const pipeline::BatchResult& result);

} // namespace ferry::engine
