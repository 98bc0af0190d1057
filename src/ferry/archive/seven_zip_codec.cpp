// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/archive/seven_zip_codec.hpp>
#include <ferry/core/log.hpp>
#include <ferry/core/process.hpp>
#include <vector>

namespace ferry::archive {

namespace {

bool contains(std::string_view haystack, std::string_view needle) noexcept {
    return haystack.find(needle) != std::string_view::npos;
}

} // namespace

core::TaskErrc SevenZipCodec::classify_failure(std::string_view output) noexcept {
    if (contains(output, "Wrong password") ||
        contains(output, "Can not open encrypted archive") ||
        contains(output, "Enter password")) {
        return core::TaskErrc::wrong_password;
    }
    if (contains(output, "Can not open the file as archive") ||
        contains(output, "Data Error") ||
        contains(output, "Unexpected end of archive") ||
        contains(output, "Headers Error")) {
        return core::TaskErrc::corrupt_archive;
    }
    return core::TaskErrc::process_failed;
}

bool SevenZipCodec::listing_is_encrypted(std::string_view listing) noexcept {
    return contains(listing, "Encrypted = +");
}

std::expected<bool, core::Failure>
SevenZipCodec::probe_encrypted(const std::filesystem::path& archive) {
    // -p- answers any password prompt with an empty password so 7z never blocks
    auto result = core::run_process({binary_, "l", "-slt", "-p-", archive.string()});
    if (!result) {
        return std::unexpected(result.error());
    }

    if (listing_is_encrypted(result->output)) {
        return true;
    }
    if (!result->ok()) {
        // Encrypted headers make the listing itself fail
        auto errc = classify_failure(result->output);
        if (errc == core::TaskErrc::wrong_password) {
            return true;
        }
        return std::unexpected(core::Failure(errc, core::tail_output(result->output)));
    }
    return false;
}

std::expected<void, core::Failure>
SevenZipCodec::extract(const std::filesystem::path& archive,
                       const std::filesystem::path& dest,
                       const std::optional<std::string>& password) {
    std::vector<std::string> args{
        binary_, "x", "-y",
        "-o" + dest.string(),
        "-p" + password.value_or(""),
        archive.string(),
    };

    auto log = core::logger("archive");
    log->debug("7z x {} -> {}", archive.string(), dest.string());

    auto result = core::run_process(args);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->ok()) {
        auto errc = classify_failure(result->output);
        log->warn("7z exited with {} ({})", result->exit_code, core::make_error_code(errc).message());
        return std::unexpected(core::Failure(errc, core::tail_output(result->output)));
    }
    return {};
}

} // namespace ferry::archive
