// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/task_coordinator.hpp>
#include <ferry/core/log.hpp>

namespace ferry::core {

//=============================================================================
// Slot
//=============================================================================

Slot::~Slot() {
    release();
}

Slot::Slot(Slot&& other) noexcept
    : owner_(other.owner_)
    , user_(other.user_)
    , token_(other.token_) {
    other.owner_ = nullptr;
}

Slot& Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        user_ = other.user_;
        token_ = other.token_;
        other.owner_ = nullptr;
    }
    return *this;
}

void Slot::release() noexcept {
    if (owner_) {
        owner_->end(user_);
        owner_ = nullptr;
    }
}

//=============================================================================
// TaskCoordinator
//=============================================================================

std::expected<CancelToken, std::error_code> TaskCoordinator::try_begin(UserId user) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& entry = slots_[user];
    if (entry.locked) {
        return std::unexpected(make_error_code(TaskErrc::busy));
    }

    // A fresh token per grant: stale cancels never leak into the next task
    entry.locked = true;
    entry.token = CancelToken{};
    entry.last_used = Clock::now();
    return entry.token;
}

void TaskCoordinator::end(UserId user) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(user);
    if (it == slots_.end()) return;

    it->second.locked = false;
    it->second.token = CancelToken{};
    it->second.last_used = Clock::now();
}

std::expected<Slot, std::error_code> TaskCoordinator::acquire(UserId user) {
    auto token = try_begin(user);
    if (!token) {
        return std::unexpected(token.error());
    }
    return Slot(this, user, *token);
}

bool TaskCoordinator::request_cancel(UserId user) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(user);
    if (it == slots_.end() || !it->second.locked) {
        return false;
    }
    it->second.token.cancel();
    logger("engine")->info("cancel requested for user {}", user);
    return true;
}

bool TaskCoordinator::busy(UserId user) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(user);
    return it != slots_.end() && it->second.locked;
}

bool TaskCoordinator::cancel_requested(UserId user) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(user);
    return it != slots_.end() && it->second.locked && it->second.token.cancelled();
}

std::size_t TaskCoordinator::evict_idle(Clock::duration max_age) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = Clock::now();
    std::size_t removed = 0;
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (!it->second.locked && now - it->second.last_used >= max_age) {
            it = slots_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t TaskCoordinator::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

} // namespace ferry::core
