// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/task_coordinator.hpp>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ferry::core {

// Per-user record. `day` is an ISO date ("2026-10-19") used for daily resets.
struct UserRecord {
    UserId id{0};
    bool premium{false};
    bool banned{false};
    std::uint32_t auto_delete_minutes{DEFAULT_TTL_MINUTES};

    std::string day;
    std::uint32_t daily_tasks{0};
    double daily_size_mb{0.0};

    std::uint64_t total_tasks{0};
    std::int64_t last_task_at{0};   // Unix seconds, 0 = never
};

struct UserCounts {
    std::size_t total{0};
    std::size_t premium{0};
    std::size_t banned{0};
};

// User settings and daily usage counters. Memory-only by default; with a
// file path every mutation is written back as JSON.
class UserStore {
public:
    UserStore() = default;
    explicit UserStore(std::filesystem::path file);

    UserStore(const UserStore&) = delete;
    UserStore& operator=(const UserStore&) = delete;

    // Idempotent create; resets daily counters when `today` differs from the stored day
    UserRecord get_or_create_user(UserId id, const std::string& today = today_string());

    [[nodiscard]] std::optional<UserRecord> find(UserId id) const;

    [[nodiscard]] bool is_banned(UserId id) const;
    void set_banned(UserId id, bool banned);
    void set_premium(UserId id, bool premium);
    void set_auto_delete(UserId id, std::uint32_t minutes);

    // Auto-delete minutes given to users created from now on
    void set_default_auto_delete(std::uint32_t minutes) noexcept { default_ttl_ = minutes; }

    // Count one finished task of `size_mb` against today's counters
    void record_task_stats(UserId id, double size_mb, const std::string& today = today_string());

    [[nodiscard]] UserCounts count() const;

    // Current local calendar day as YYYY-MM-DD
    [[nodiscard]] static std::string today_string();

private:
    UserRecord& touch_locked(UserId id, const std::string& today);
    void load();
    void save_locked();

    std::unordered_map<UserId, UserRecord> users_;
    std::filesystem::path file_;
    std::uint32_t default_ttl_{DEFAULT_TTL_MINUTES};
    mutable std::mutex mutex_;
};

} // namespace ferry::core
