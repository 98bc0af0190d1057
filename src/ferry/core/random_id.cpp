// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/random_id.hpp>
#include <cstdio>
#include <random>

namespace ferry::core {

std::string random_hex() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
    return buf;
}

} // namespace ferry::core
