// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/archive/archive_codec.hpp>
#include <string>
#include <string_view>

namespace ferry::archive {

// ArchiveCodec backed by the 7z command line tool
class SevenZipCodec final : public ArchiveCodec {
public:
    explicit SevenZipCodec(std::string binary = "7z") : binary_(std::move(binary)) {}

    [[nodiscard]] std::expected<bool, core::Failure>
    probe_encrypted(const std::filesystem::path& archive) override;

    [[nodiscard]] std::expected<void, core::Failure>
    extract(const std::filesystem::path& archive,
            const std::filesystem::path& dest,
            const std::optional<std::string>& password) override;

    // Map 7z output of a failed run onto an error code
    [[nodiscard]] static core::TaskErrc classify_failure(std::string_view output) noexcept;

    // True when a `7z l -slt` listing marks any entry as encrypted
    [[nodiscard]] static bool listing_is_encrypted(std::string_view listing) noexcept;

private:
    std::string binary_;
};

} // namespace ferry::archive
