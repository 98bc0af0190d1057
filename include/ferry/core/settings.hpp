// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::core {

// Runtime configuration. Defaults mirror config.hpp.
struct Settings {
    std::filesystem::path temp_dir{std::string(DEFAULT_TEMP_DIR)};
    std::uint32_t ttl_minutes{DEFAULT_TTL_MINUTES};
    std::chrono::seconds sweep_interval{SWEEP_INTERVAL};
    std::chrono::seconds progress_interval{PROGRESS_INTERVAL};
    std::string log_level{"info"};

    // Empty path keeps the store in memory only
    std::filesystem::path user_store;
    std::filesystem::path registry_journal;

    std::string seven_zip{"7z"};
    std::string ffmpeg{"ffmpeg"};

    std::string cloud_drive_domain{std::string(CLOUD_DRIVE_DOMAIN)};
    std::vector<std::string> platform_domains{"t.me", "telegram.me"};

    // Load a JSON settings file, then apply FERRY_* environment overrides.
    // A missing file is not an error: defaults plus environment are returned.
    [[nodiscard]] static std::expected<Settings, Failure>
    load(const std::filesystem::path& path);

    // Parse a JSON document (no environment overrides)
    [[nodiscard]] static std::expected<Settings, Failure>
    parse(std::string_view json_text);

    void apply_environment();
};

} // namespace ferry::core
