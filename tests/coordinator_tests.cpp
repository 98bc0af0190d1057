// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/task_coordinator.hpp>
#include <atomic>
#include <thread>
#include <utility>
#include <vector>

using namespace ferry::core;

TEST_CASE("TaskCoordinator grants one slot per user", "[coordinator]") {
    TaskCoordinator coordinator;

    auto first = coordinator.try_begin(7);
    REQUIRE(first.has_value());
    CHECK(coordinator.busy(7));

    auto second = coordinator.try_begin(7);
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error() == TaskErrc::busy);

    SECTION("Other users are independent") {
        CHECK(coordinator.try_begin(8).has_value());
        coordinator.end(8);
    }

    coordinator.end(7);
    CHECK_FALSE(coordinator.busy(7));
    CHECK(coordinator.try_begin(7).has_value());
    coordinator.end(7);
}

TEST_CASE("Cancellation flags the running task only", "[coordinator]") {
    TaskCoordinator coordinator;

    CHECK_FALSE(coordinator.request_cancel(1));

    auto token = coordinator.try_begin(1);
    REQUIRE(token.has_value());
    CHECK_FALSE(token->cancelled());
    CHECK_FALSE(token->checkpoint());

    CHECK(coordinator.request_cancel(1));
    CHECK(token->cancelled());
    CHECK(coordinator.cancel_requested(1));
    CHECK(token->checkpoint() == TaskErrc::cancelled);

    coordinator.end(1);
    CHECK_FALSE(coordinator.cancel_requested(1));

    // A new task starts with a clean flag
    auto next = coordinator.try_begin(1);
    REQUIRE(next.has_value());
    CHECK_FALSE(next->cancelled());
    coordinator.end(1);
}

TEST_CASE("request_cancel may throw", "[coordinator]") {
    // It logs, and logger lookup can fail
    STATIC_REQUIRE_FALSE(noexcept(std::declval<TaskCoordinator&>().request_cancel(1)));
}

TEST_CASE("Cancel then restart while the first task winds down", "[coordinator]") {
    TaskCoordinator coordinator;

    auto running = coordinator.acquire(3);
    REQUIRE(running.has_value());
    auto old_token = running->token();

    // Second request is refused, the user cancels the first
    CHECK(coordinator.acquire(3).error() == TaskErrc::busy);
    CHECK(coordinator.request_cancel(3));

    // First task notices at its next checkpoint and finishes
    CHECK(old_token.checkpoint() == TaskErrc::cancelled);
    running->release();

    auto fresh = coordinator.acquire(3);
    REQUIRE(fresh.has_value());
    CHECK_FALSE(fresh->token().cancelled());
    CHECK(old_token.cancelled());
}

TEST_CASE("Slot releases on every exit path", "[coordinator]") {
    TaskCoordinator coordinator;

    SECTION("Scope exit") {
        {
            auto slot = coordinator.acquire(5);
            REQUIRE(slot.has_value());
            CHECK(slot->held());
            CHECK(coordinator.busy(5));
        }
        CHECK_FALSE(coordinator.busy(5));
    }

    SECTION("Exception unwinding") {
        try {
            auto slot = coordinator.acquire(5);
            REQUIRE(slot.has_value());
            throw std::runtime_error("tool crashed");
        } catch (const std::runtime_error&) {
        }
        CHECK_FALSE(coordinator.busy(5));
    }

    SECTION("Move transfers ownership") {
        Slot outer;
        {
            auto slot = coordinator.acquire(5);
            REQUIRE(slot.has_value());
            outer = std::move(*slot);
        }
        CHECK(coordinator.busy(5));
        CHECK(outer.held());
        outer.release();
        outer.release();
        CHECK_FALSE(coordinator.busy(5));
    }
}

TEST_CASE("Concurrent begin admits exactly one", "[coordinator]") {
    TaskCoordinator coordinator;
    std::atomic<int> granted{0};

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] {
                if (coordinator.try_begin(99)) {
                    ++granted;
                }
            });
        }
    }

    CHECK(granted.load() == 1);
    coordinator.end(99);
}

TEST_CASE("evict_idle drops only idle entries", "[coordinator]") {
    TaskCoordinator coordinator;

    REQUIRE(coordinator.try_begin(1).has_value());
    REQUIRE(coordinator.try_begin(2).has_value());
    coordinator.end(2);
    CHECK(coordinator.size() == 2);

    CHECK(coordinator.evict_idle(std::chrono::hours(1)) == 0);
    CHECK(coordinator.evict_idle(std::chrono::seconds(0)) == 1);
    CHECK(coordinator.size() == 1);
    CHECK(coordinator.busy(1));
    coordinator.end(1);
}
