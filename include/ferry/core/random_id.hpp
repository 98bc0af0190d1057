// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>

namespace ferry::core {

// 16 lowercase hex digits from a freshly seeded generator
[[nodiscard]] std::string random_hex();

} // namespace ferry::core
