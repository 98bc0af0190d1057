// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <string_view>

namespace ferry::core {

constexpr std::string_view DEFAULT_TEMP_DIR = "./ferry-tmp";
constexpr std::uint32_t DEFAULT_TTL_MINUTES = 30;                   // Scratch dirs live half an hour

constexpr std::chrono::seconds SWEEP_INTERVAL{300};                 // Every 5 minutes
constexpr std::chrono::seconds PROGRESS_INTERVAL{5};                // Status edits are rate limited
constexpr std::chrono::hours SLOT_IDLE_EVICTION{6};

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;                  // 64 KB
constexpr std::size_t MAX_MANIFEST_SIZE = 4 * 1024 * 1024;          // 4 MB

constexpr std::string_view CLOUD_DRIVE_DOMAIN = "drive.google.com";
constexpr std::string_view CLOUD_DRIVE_DOWNLOAD = "https://drive.google.com/uc?export=download&id=";

constexpr std::size_t CLEAN_TEXT_LIMIT = 4000;

} // namespace ferry::core
