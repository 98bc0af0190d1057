// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/user_store.hpp>
#include <ferry/core/log.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>

namespace ferry::core {

namespace fs = std::filesystem;

namespace {

nlohmann::json to_json(const UserRecord& u) {
    return {
        {"id", u.id},
        {"premium", u.premium},
        {"banned", u.banned},
        {"auto_delete_minutes", u.auto_delete_minutes},
        {"day", u.day},
        {"daily_tasks", u.daily_tasks},
        {"daily_size_mb", u.daily_size_mb},
        {"total_tasks", u.total_tasks},
        {"last_task_at", u.last_task_at},
    };
}

UserRecord from_json(const nlohmann::json& j) {
    UserRecord u;
    u.id = j.at("id").get<UserId>();
    u.premium = j.value("premium", false);
    u.banned = j.value("banned", false);
    u.auto_delete_minutes = j.value("auto_delete_minutes", DEFAULT_TTL_MINUTES);
    u.day = j.value("day", std::string{});
    u.daily_tasks = j.value("daily_tasks", std::uint32_t{0});
    u.daily_size_mb = j.value("daily_size_mb", 0.0);
    u.total_tasks = j.value("total_tasks", std::uint64_t{0});
    u.last_task_at = j.value("last_task_at", std::int64_t{0});
    return u;
}

} // namespace

UserStore::UserStore(fs::path file)
    : file_(std::move(file)) {
    load();
}

std::string UserStore::today_string() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

UserRecord& UserStore::touch_locked(UserId id, const std::string& today) {
    auto [it, created] = users_.try_emplace(id);
    auto& user = it->second;
    if (created) {
        user.id = id;
        user.day = today;
        user.auto_delete_minutes = default_ttl_;
        logger("engine")->debug("new user {}", id);
    } else if (user.day != today) {
        user.day = today;
        user.daily_tasks = 0;
        user.daily_size_mb = 0.0;
    }
    return user;
}

UserRecord UserStore::get_or_create_user(UserId id, const std::string& today) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto before = users_.size();
    auto copy = touch_locked(id, today);
    if (users_.size() != before) {
        save_locked();
    }
    return copy;
}

std::optional<UserRecord> UserStore::find(UserId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end()) return std::nullopt;
    return it->second;
}

bool UserStore::is_banned(UserId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    return it != users_.end() && it->second.banned;
}

void UserStore::set_banned(UserId id, bool banned) {
    std::lock_guard<std::mutex> lock(mutex_);
    touch_locked(id, today_string()).banned = banned;
    save_locked();
}

void UserStore::set_premium(UserId id, bool premium) {
    std::lock_guard<std::mutex> lock(mutex_);
    touch_locked(id, today_string()).premium = premium;
    save_locked();
}

void UserStore::set_auto_delete(UserId id, std::uint32_t minutes) {
    std::lock_guard<std::mutex> lock(mutex_);
    touch_locked(id, today_string()).auto_delete_minutes = minutes;
    save_locked();
}

void UserStore::record_task_stats(UserId id, double size_mb, const std::string& today) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& user = touch_locked(id, today);
    ++user.daily_tasks;
    ++user.total_tasks;
    user.daily_size_mb += size_mb;
    user.last_task_at = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    save_locked();
}

UserCounts UserStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    UserCounts counts;
    counts.total = users_.size();
    for (const auto& [id, user] : users_) {
        if (user.premium) ++counts.premium;
        if (user.banned) ++counts.banned;
    }
    return counts;
}

void UserStore::load() {
    std::error_code ec;
    if (file_.empty() || !fs::exists(file_, ec)) return;

    std::ifstream in(file_);
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.contains("users")) {
        logger("engine")->warn("user store {} is unreadable; starting empty", file_.string());
        return;
    }

    try {
        for (const auto& item : j["users"]) {
            auto user = from_json(item);
            users_[user.id] = std::move(user);
        }
    } catch (const nlohmann::json::exception& e) {
        logger("engine")->warn("user store {} is malformed: {}", file_.string(), e.what());
    }
}

void UserStore::save_locked() {
    if (file_.empty()) return;

    nlohmann::json j;
    j["users"] = nlohmann::json::array();
    for (const auto& [id, user] : users_) {
        j["users"].push_back(to_json(user));
    }

    std::error_code ec;
    if (file_.has_parent_path()) {
        fs::create_directories(file_.parent_path(), ec);
    }
    auto tmp = file_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            logger("engine")->warn("cannot write user store {}", tmp.string());
            return;
        }
        out << j.dump(2);
    }
    fs::rename(tmp, file_, ec);
    if (ec) {
        logger("engine")->warn("cannot replace user store: {}", ec.message());
    }
}

} // namespace ferry::core
