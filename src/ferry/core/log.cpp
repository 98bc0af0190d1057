// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace ferry::core {

namespace {

std::mutex g_logger_mutex;
spdlog::level::level_enum g_level = spdlog::level::info;

} // namespace

std::shared_ptr<spdlog::logger> logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto created = spdlog::stderr_color_mt(name);
    created->set_level(g_level);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
}

void set_log_level(std::string_view level) noexcept {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_level = spdlog::level::from_str(std::string(level));
    spdlog::set_level(g_level);
}

} // namespace ferry::core
