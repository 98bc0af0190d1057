// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/console_messenger.hpp>

namespace ferry::cli {

namespace fs = std::filesystem;

ConsoleMessenger::ConsoleMessenger(std::ostream& out, fs::path output_dir)
    : out_(out)
    , output_dir_(std::move(output_dir))
    , bar_(out) {}

std::expected<engine::StatusId, core::Failure>
ConsoleMessenger::create_status(core::UserId, const std::string& text) {
    bar_.clear();
    out_ << text << std::endl;
    return next_status_++;
}

std::expected<void, core::Failure>
ConsoleMessenger::edit_status(engine::StatusId, const std::string& text) {
    bar_.finish();
    out_ << text << std::endl;
    return {};
}

std::expected<void, core::Failure> ConsoleMessenger::delete_status(engine::StatusId) {
    bar_.clear();
    return {};
}

std::expected<void, core::Failure> ConsoleMessenger::pin_status(engine::StatusId) {
    return {};
}

std::expected<void, core::Failure> ConsoleMessenger::unpin_status(engine::StatusId) {
    return {};
}

std::expected<void, core::Failure>
ConsoleMessenger::report_progress(engine::StatusId, const std::string& label, const core::ProgressSample& sample) {
    if (bar_.label() != label) {
        bar_.finish();
        bar_.label(label);
    }
    bar_.update(sample);
    if (sample.total > 0 && sample.current >= sample.total) {
        bar_.finish();
    }
    return {};
}

std::expected<void, core::Failure>
ConsoleMessenger::deliver_document(core::UserId, const fs::path& file, const std::string&) {
    return deliver(file, "document");
}

std::expected<void, core::Failure>
ConsoleMessenger::deliver_video(core::UserId, const fs::path& file, const std::string&) {
    return deliver(file, "video");
}

std::expected<void, core::Failure>
ConsoleMessenger::deliver(const fs::path& file, std::string_view kind) {
    bar_.finish();

    fs::path final_path = file;
    if (!output_dir_.empty()) {
        std::error_code ec;
        fs::create_directories(output_dir_, ec);
        final_path = output_dir_ / file.filename();
        if (!ec) {
            fs::copy_file(file, final_path, fs::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            return std::unexpected(core::Failure(core::TaskErrc::resource_error,
                                                 final_path.string() + ": " + ec.message()));
        }
    }

    out_ << "  [" << kind << "] " << final_path.string() << std::endl;
    delivered_.push_back(final_path);
    return {};
}

} // namespace ferry::cli
