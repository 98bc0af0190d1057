// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/cli/progress_bar.hpp>
#include <ferry/engine/messenger.hpp>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::cli {

// Messenger on a terminal. Status edits print a new line; deliveries print
// the artifact path and, with an output directory, copy the file there
// before the scratch dir is swept.
class ConsoleMessenger final : public engine::Messenger {
public:
    explicit ConsoleMessenger(std::ostream& out, std::filesystem::path output_dir = {});

    [[nodiscard]] std::expected<engine::StatusId, core::Failure>
    create_status(core::UserId chat, const std::string& text) override;

    std::expected<void, core::Failure> edit_status(engine::StatusId status, const std::string& text) override;
    std::expected<void, core::Failure> delete_status(engine::StatusId status) override;
    std::expected<void, core::Failure> pin_status(engine::StatusId status) override;
    std::expected<void, core::Failure> unpin_status(engine::StatusId status) override;

    std::expected<void, core::Failure>
    report_progress(engine::StatusId status, const std::string& label, const core::ProgressSample& sample) override;

    [[nodiscard]] std::expected<void, core::Failure>
    deliver_document(core::UserId chat, const std::filesystem::path& file, const std::string& caption) override;

    [[nodiscard]] std::expected<void, core::Failure>
    deliver_video(core::UserId chat, const std::filesystem::path& file, const std::string& caption) override;

    [[nodiscard]] const std::vector<std::filesystem::path>& delivered() const noexcept { return delivered_; }

private:
    [[nodiscard]] std::expected<void, core::Failure>
    deliver(const std::filesystem::path& file, std::string_view kind);

    std::ostream& out_;
    std::filesystem::path output_dir_;
    ProgressBar bar_;
    engine::StatusId next_status_{1};
    std::vector<std::filesystem::path> delivered_;
};

} // namespace ferry::cli
