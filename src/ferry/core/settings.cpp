// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/settings.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ferry::core {

namespace {

using json = nlohmann::json;

// Read `key` into `out` if present; a type mismatch is reported by name
template<typename T>
bool read_key(const json& j, const char* key, T& out, std::string& bad_key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    try {
        out = it->get<T>();
        return true;
    } catch (const json::exception&) {
        bad_key = key;
        return false;
    }
}

bool parse_unsigned(const char* text, std::uint32_t& out) {
    if (!text || !*text) return false;
    char* end = nullptr;
    unsigned long val = std::strtoul(text, &end, 10);
    if (end == nullptr || *end != '\0') return false;
    out = static_cast<std::uint32_t>(val);
    return true;
}

} // namespace

std::expected<Settings, Failure> Settings::parse(std::string_view json_text) {
    json j = json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::unexpected(Failure{std::make_error_code(std::errc::invalid_argument),
                                       "settings: not a JSON object"});
    }

    Settings s;
    std::string bad_key;

    std::string temp_dir = s.temp_dir.string();
    std::string user_store;
    std::string registry_journal;
    std::int64_t sweep_seconds = s.sweep_interval.count();
    std::int64_t progress_seconds = s.progress_interval.count();

    bool ok = read_key(j, "temp_dir", temp_dir, bad_key)
           && read_key(j, "ttl_minutes", s.ttl_minutes, bad_key)
           && read_key(j, "sweep_interval_seconds", sweep_seconds, bad_key)
           && read_key(j, "progress_interval_seconds", progress_seconds, bad_key)
           && read_key(j, "log_level", s.log_level, bad_key)
           && read_key(j, "user_store", user_store, bad_key)
           && read_key(j, "registry_journal", registry_journal, bad_key)
           && read_key(j, "seven_zip", s.seven_zip, bad_key)
           && read_key(j, "ffmpeg", s.ffmpeg, bad_key)
           && read_key(j, "cloud_drive_domain", s.cloud_drive_domain, bad_key)
           && read_key(j, "platform_domains", s.platform_domains, bad_key);

    if (!ok) {
        return std::unexpected(Failure{std::make_error_code(std::errc::invalid_argument),
                                       "settings: bad value for '" + bad_key + "'"});
    }
    if (sweep_seconds <= 0 || progress_seconds < 0) {
        return std::unexpected(Failure{std::make_error_code(std::errc::invalid_argument),
                                       "settings: intervals must be positive"});
    }

    s.temp_dir = temp_dir;
    s.user_store = user_store;
    s.registry_journal = registry_journal;
    s.sweep_interval = std::chrono::seconds(sweep_seconds);
    s.progress_interval = std::chrono::seconds(progress_seconds);
    return s;
}

std::expected<Settings, Failure> Settings::load(const std::filesystem::path& path) {
    Settings s;

    if (!path.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            std::ifstream file(path, std::ios::binary);
            if (!file) {
                return std::unexpected(Failure{std::make_error_code(std::errc::io_error),
                                               "settings: cannot read " + path.string()});
            }
            std::ostringstream ss;
            ss << file.rdbuf();

            auto parsed = parse(ss.str());
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            s = std::move(*parsed);
        }
    }

    s.apply_environment();
    return s;
}

void Settings::apply_environment() {
    if (const char* dir = std::getenv("FERRY_TEMP_DIR"); dir && *dir) {
        temp_dir = dir;
    }
    std::uint32_t ttl = 0;
    if (parse_unsigned(std::getenv("FERRY_TTL_MINUTES"), ttl) && ttl > 0) {
        ttl_minutes = ttl;
    }
    if (const char* level = std::getenv("FERRY_LOG_LEVEL"); level && *level) {
        log_level = level;
    }
}

} // namespace ferry::core
