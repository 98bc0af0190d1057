// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace ferry::core {

using UserId = std::int64_t;

// Cooperative cancellation flag shared between the coordinator and a
// running pipeline. Pipelines poll it at their checkpoints only.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    [[nodiscard]] bool cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

    // Checkpoint helper: cancelled error code if the flag is set
    [[nodiscard]] std::error_code checkpoint() const noexcept {
        return cancelled() ? make_error_code(TaskErrc::cancelled) : std::error_code{};
    }

    void cancel() const noexcept { flag_->store(true, std::memory_order_release); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

class TaskCoordinator;

// Held execution slot; releases on destruction
class Slot {
public:
    Slot() = default;
    Slot(TaskCoordinator* owner, UserId user, const CancelToken& token) noexcept
        : owner_(owner), user_(user), token_(token) {}
    ~Slot();

    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot(Slot&& other) noexcept;
    Slot& operator=(Slot&& other) noexcept;

    [[nodiscard]] UserId user() const noexcept { return user_; }
    [[nodiscard]] const CancelToken& token() const noexcept { return token_; }
    [[nodiscard]] bool held() const noexcept { return owner_ != nullptr; }

    // Release early; idempotent
    void release() noexcept;

private:
    TaskCoordinator* owner_{nullptr};
    UserId user_{0};
    CancelToken token_;
};

// Per-user single-flight gate and cancellation flag store.
// Entries are created lazily and evicted only when idle.
class TaskCoordinator {
public:
    using Clock = std::chrono::steady_clock;

    TaskCoordinator() = default;

    TaskCoordinator(const TaskCoordinator&) = delete;
    TaskCoordinator& operator=(const TaskCoordinator&) = delete;

    // Grant the user's slot or fail with busy. Never queues.
    [[nodiscard]] std::expected<CancelToken, std::error_code> try_begin(UserId user);

    // Release the slot and clear any pending cancellation
    void end(UserId user) noexcept;

    // RAII form of try_begin/end
    [[nodiscard]] std::expected<Slot, std::error_code> acquire(UserId user);

    // Flag the running task (if any). Returns true if a task was running.
    bool request_cancel(UserId user);

    [[nodiscard]] bool busy(UserId user) const noexcept;
    [[nodiscard]] bool cancel_requested(UserId user) const noexcept;

    // Drop idle entries untouched for at least `max_age`; returns count removed
    std::size_t evict_idle(Clock::duration max_age) noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

private:
    struct Entry {
        bool locked{false};
        CancelToken token;
        Clock::time_point last_used{Clock::now()};
    };

    std::unordered_map<UserId, Entry> slots_;
    mutable std::mutex mutex_;
};

} // namespace ferry::core
