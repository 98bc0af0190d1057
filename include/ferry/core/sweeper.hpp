// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/resource_registry.hpp>
#include <ferry/core/task_coordinator.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <thread>

namespace ferry::core {

// Periodic cleanup loop. Runs independently of any task: each tick sweeps
// expired temp resources and evicts idle coordinator entries.
class Sweeper {
public:
    Sweeper(ResourceRegistry& registry,
            TaskCoordinator& coordinator,
            std::chrono::seconds interval = SWEEP_INTERVAL,
            std::chrono::seconds idle_eviction = SLOT_IDLE_EVICTION);
    ~Sweeper();

    Sweeper(const Sweeper&) = delete;
    Sweeper& operator=(const Sweeper&) = delete;

    void start();
    void stop() noexcept;

    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }

    // One pass, on the caller's thread
    SweepReport run_once();

    [[nodiscard]] std::uint64_t passes() const noexcept { return passes_.load(); }

private:
    void loop(std::stop_token stoken) noexcept;

    ResourceRegistry& registry_;
    TaskCoordinator& coordinator_;
    std::chrono::seconds interval_;
    std::chrono::seconds idle_eviction_;

    std::mutex mutex_;
    std::condition_variable_any wake_;
    std::atomic<std::uint64_t> passes_{0};
    std::jthread thread_;
};

} // namespace ferry::core
