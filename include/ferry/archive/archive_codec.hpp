// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace ferry::archive {

// Byte-level archive decoder. Implementations must report a bad or missing
// password as wrong_password so callers can re-prompt, and any other decode
// failure with the tool's diagnostic in Failure::detail.
class ArchiveCodec {
public:
    virtual ~ArchiveCodec() = default;

    // Cheap probe: true when the archive cannot be read without a password
    [[nodiscard]] virtual std::expected<bool, core::Failure>
    probe_encrypted(const std::filesystem::path& archive) = 0;

    // Unpack everything into `dest` (created by the caller)
    [[nodiscard]] virtual std::expected<void, core::Failure>
    extract(const std::filesystem::path& archive,
            const std::filesystem::path& dest,
            const std::optional<std::string>& password) = 0;
};

} // namespace ferry::archive
