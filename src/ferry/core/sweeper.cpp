// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/sweeper.hpp>
#include <ferry/core/log.hpp>

namespace ferry::core {

Sweeper::Sweeper(ResourceRegistry& registry,
                 TaskCoordinator& coordinator,
                 std::chrono::seconds interval,
                 std::chrono::seconds idle_eviction)
    : registry_(registry)
    , coordinator_(coordinator)
    , interval_(interval)
    , idle_eviction_(idle_eviction) {}

Sweeper::~Sweeper() {
    stop();
}

void Sweeper::start() {
    if (thread_.joinable()) return;

    logger("sweeper")->debug("starting, interval {}s", interval_.count());
    thread_ = std::jthread([this](std::stop_token stoken) {
        loop(stoken);
    });
}

void Sweeper::stop() noexcept {
    if (!thread_.joinable()) return;

    thread_.request_stop();
    wake_.notify_all();
    thread_.join();
}

SweepReport Sweeper::run_once() {
    auto report = registry_.sweep();
    auto evicted = coordinator_.evict_idle(idle_eviction_);
    ++passes_;

    if (!report.empty() || evicted > 0) {
        logger("sweeper")->info("pass {}: {} records expired, {} dirs removed, {} kept for retry, {} idle slots evicted",
                                passes_.load(), report.removed.size(), report.deleted.size(),
                                report.errors.size(), evicted);
    }
    return report;
}

void Sweeper::loop(std::stop_token stoken) noexcept {
    while (!stoken.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // Returns early when stop is requested
            wake_.wait_for(lock, stoken, interval_, [] { return false; });
        }
        if (stoken.stop_requested()) break;

        try {
            run_once();
        } catch (const std::exception& e) {
            // The next tick retries
            logger("sweeper")->error("sweep failed: {}", e.what());
        }
    }
    logger("sweeper")->debug("stopped");
}

} // namespace ferry::core
