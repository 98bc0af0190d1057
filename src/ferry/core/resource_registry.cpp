// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/resource_registry.hpp>
#include <ferry/core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace ferry::core {

namespace fs = std::filesystem;

namespace {

// Journal format:
// {"next_id": N, "records": [{"id", "owner", "path", "created_at" (unix s), "ttl_min"}]}

std::int64_t to_unix(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_unix(std::int64_t secs) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(secs));
}

} // namespace

ResourceRegistry::ResourceRegistry(fs::path journal)
    : journal_(std::move(journal)) {
    load_journal();
}

RecordId ResourceRegistry::register_path(UserId owner,
                                         fs::path path,
                                         std::chrono::minutes ttl,
                                         Clock::time_point created_at) {
    std::lock_guard<std::mutex> lock(mutex_);

    TempResourceRecord record;
    record.id = next_id_++;
    record.owner = owner;
    record.path = std::move(path);
    record.created_at = created_at;
    record.ttl = ttl;

    logger("registry")->debug("register #{} {} (owner {}, ttl {} min)",
                              record.id, record.path.string(), owner, ttl.count());
    records_.push_back(std::move(record));
    save_journal_locked();
    return records_.back().id;
}

SweepReport ResourceRegistry::sweep(Clock::time_point now) {
    SweepReport report;

    // Snapshot expired records; file deletion happens outside the lock
    std::vector<TempResourceRecord> expired;
    std::unordered_set<std::string> live_paths;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& r : records_) {
            if (r.expired(now)) {
                expired.push_back(r);
            } else {
                live_paths.insert(r.path.lexically_normal().string());
            }
        }
    }

    if (expired.empty()) {
        return report;
    }

    auto log = logger("registry");
    for (const auto& r : expired) {
        // A duplicate registration that is still live keeps the path on disk
        if (live_paths.contains(r.path.lexically_normal().string())) {
            report.removed.push_back(r.id);
            continue;
        }

        // Records whose path could not be removed stay for the next pass
        std::error_code ec;
        bool present = fs::exists(r.path, ec);
        if (ec) {
            log->warn("cannot stat {}: {}", r.path.string(), ec.message());
            report.errors.push_back(r.path.string() + ": " + ec.message());
            continue;
        }
        if (!present) {
            report.removed.push_back(r.id);
            continue;
        }

        fs::remove_all(r.path, ec);
        if (ec) {
            log->warn("cannot remove {}: {}", r.path.string(), ec.message());
            report.errors.push_back(r.path.string() + ": " + ec.message());
            continue;
        }
        log->info("swept {} (owner {})", r.path.string(), r.owner);
        report.deleted.push_back(r.path);
        report.removed.push_back(r.id);
    }

    if (!report.removed.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::unordered_set<RecordId> gone(report.removed.begin(), report.removed.end());
        std::erase_if(records_, [&gone](const TempResourceRecord& r) { return gone.contains(r.id); });
        save_journal_locked();
    }

    return report;
}

std::vector<TempResourceRecord> ResourceRegistry::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::vector<TempResourceRecord> ResourceRegistry::records_for(UserId owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TempResourceRecord> out;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(out),
                 [owner](const TempResourceRecord& r) { return r.owner == owner; });
    return out;
}

bool ResourceRegistry::tracks(const fs::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto wanted = path.lexically_normal();
    return std::any_of(records_.begin(), records_.end(),
                       [&wanted](const TempResourceRecord& r) {
                           auto rel = wanted.lexically_relative(r.path.lexically_normal());
                           return !rel.empty() && *rel.begin() != "..";
                       });
}

std::size_t ResourceRegistry::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::string ResourceRegistry::journal_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return journal_error_;
}

void ResourceRegistry::load_journal() {
    if (journal_.empty()) return;

    std::error_code ec;
    if (!fs::exists(journal_, ec)) return;

    std::ifstream file(journal_);
    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        journal_error_ = "unreadable journal " + journal_.string();
        logger("registry")->warn("{}; starting empty", journal_error_);
        return;
    }

    try {
        next_id_ = j.value("next_id", RecordId{1});
        for (const auto& item : j.at("records")) {
            TempResourceRecord r;
            r.id = item.at("id").get<RecordId>();
            r.owner = item.at("owner").get<UserId>();
            r.path = item.at("path").get<std::string>();
            r.created_at = from_unix(item.at("created_at").get<std::int64_t>());
            r.ttl = std::chrono::minutes(item.at("ttl_min").get<std::int64_t>());
            next_id_ = std::max(next_id_, r.id + 1);
            records_.push_back(std::move(r));
        }
    } catch (const nlohmann::json::exception& e) {
        journal_error_ = e.what();
        logger("registry")->warn("journal {} is malformed: {}", journal_.string(), e.what());
    }

    logger("registry")->info("restored {} temp records from {}", records_.size(), journal_.string());
}

void ResourceRegistry::save_journal_locked() {
    if (journal_.empty()) return;

    nlohmann::json j;
    j["next_id"] = next_id_;
    j["records"] = nlohmann::json::array();
    for (const auto& r : records_) {
        j["records"].push_back({
            {"id", r.id},
            {"owner", r.owner},
            {"path", r.path.string()},
            {"created_at", to_unix(r.created_at)},
            {"ttl_min", r.ttl.count()},
        });
    }

    // Write-then-rename so a crash never leaves a truncated journal
    std::error_code ec;
    if (journal_.has_parent_path()) {
        fs::create_directories(journal_.parent_path(), ec);
    }
    auto tmp = journal_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            journal_error_ = "cannot write " + tmp.string();
            logger("registry")->warn("{}", journal_error_);
            return;
        }
        out << j.dump(2);
    }
    fs::rename(tmp, journal_, ec);
    if (ec) {
        journal_error_ = ec.message();
        logger("registry")->warn("cannot replace journal: {}", ec.message());
        return;
    }
    journal_error_.clear();
}

} // namespace ferry::core
