// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <ferry/core/progress.hpp>
#include <ferry/core/task_coordinator.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace ferry::engine {

using StatusId = std::int64_t;

// Chat front-end as seen by the engine. Status calls are best effort:
// the engine logs their failures and carries on.
class Messenger {
public:
    virtual ~Messenger() = default;

    [[nodiscard]] virtual std::expected<StatusId, core::Failure>
    create_status(core::UserId chat, const std::string& text) = 0;

    virtual std::expected<void, core::Failure> edit_status(StatusId status, const std::string& text) = 0;
    virtual std::expected<void, core::Failure> delete_status(StatusId status) = 0;

    // Coarse "operation in progress" marker for long batches
    virtual std::expected<void, core::Failure> pin_status(StatusId status) = 0;
    virtual std::expected<void, core::Failure> unpin_status(StatusId status) = 0;

    // Transfer progress for the item described by `label`. The default
    // renders a text block and edits the status with it.
    virtual std::expected<void, core::Failure>
    report_progress(StatusId status, const std::string& label, const core::ProgressSample& sample);

    // Final artifacts. An error means the user did not receive the file.
    [[nodiscard]] virtual std::expected<void, core::Failure>
    deliver_document(core::UserId chat, const std::filesystem::path& file, const std::string& caption) = 0;

    [[nodiscard]] virtual std::expected<void, core::Failure>
    deliver_video(core::UserId chat, const std::filesystem::path& file, const std::string& caption) = 0;
};

// "label\n42% | 1.00 MB / 2.00 MB | 512.0 KB/s | ETA 2s"
[[nodiscard]] std::string progress_text(const std::string& label, const core::ProgressSample& sample);

} // namespace ferry::engine
