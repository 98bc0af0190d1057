// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace ferry::core {

// Named logger on the shared console sink, created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> logger(const std::string& name);

// Apply a textual level ("trace".."off") to every ferry logger
void set_log_level(std::string_view level) noexcept;

} // namespace ferry::core
