// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <ferry/core/task_coordinator.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace ferry::core {

using RecordId = std::uint64_t;

// A scratch path that becomes deletable once created_at + ttl has passed.
// created_at uses the wall clock so journaled records survive restarts.
struct TempResourceRecord {
    RecordId id{0};
    UserId owner{0};
    std::filesystem::path path;
    std::chrono::system_clock::time_point created_at;
    std::chrono::minutes ttl{0};

    [[nodiscard]] std::chrono::system_clock::time_point expires_at() const noexcept {
        return created_at + ttl;
    }
    [[nodiscard]] bool expired(std::chrono::system_clock::time_point now) const noexcept {
        return expires_at() <= now;
    }
};

// Outcome of one sweep pass
struct SweepReport {
    std::vector<RecordId> removed;               // Records deleted this pass
    std::vector<std::filesystem::path> deleted;  // Subtrees actually removed from disk
    std::vector<std::string> errors;             // Paths that could not be removed; their records are kept

    [[nodiscard]] bool empty() const noexcept { return removed.empty() && errors.empty(); }
};

// Registry of temporary resources with time-to-live.
//
// Mutation is append-only plus bulk delete by sweep(). A sweep works on a
// snapshot of the expired records and then removes exactly those ids, so
// records registered while a sweep is deleting files are never touched.
class ResourceRegistry {
public:
    using Clock = std::chrono::system_clock;

    // Memory-only registry
    ResourceRegistry() = default;

    // Journaled registry: records are reloaded from and mirrored to `journal`
    explicit ResourceRegistry(std::filesystem::path journal);

    ResourceRegistry(const ResourceRegistry&) = delete;
    ResourceRegistry& operator=(const ResourceRegistry&) = delete;

    // Register before writing anything under `path`. Re-registering the
    // same path is harmless: the later expiry simply keeps it alive longer.
    RecordId register_path(UserId owner,
                           std::filesystem::path path,
                           std::chrono::minutes ttl,
                           Clock::time_point created_at = Clock::now());

    // Delete every record with created_at + ttl <= now and its subtree.
    // A missing path counts as already clean.
    SweepReport sweep(Clock::time_point now = Clock::now());

    [[nodiscard]] std::vector<TempResourceRecord> records() const;
    [[nodiscard]] std::vector<TempResourceRecord> records_for(UserId owner) const;
    [[nodiscard]] bool tracks(const std::filesystem::path& path) const;
    [[nodiscard]] std::size_t size() const noexcept;

    // Last journal error, empty when healthy
    [[nodiscard]] std::string journal_error() const;

private:
    void load_journal();
    void save_journal_locked();

    std::vector<TempResourceRecord> records_;
    RecordId next_id_{1};
    std::filesystem::path journal_;
    std::string journal_error_;
    mutable std::mutex mutex_;
};

} // namespace ferry::core
