// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/progress.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace ferry::core;
using namespace std::chrono_literals;

namespace {

using Clock = std::chrono::steady_clock;

} // namespace

TEST_CASE("compute_progress - rate limiting", "[progress]") {
    auto t0 = Clock::time_point{} + 1h;

    SECTION("First report is always due") {
        auto s = compute_progress(10, 100, t0, std::nullopt, t0 + 1s, 5s);
        REQUIRE(s.has_value());
        CHECK(s->percent == Catch::Approx(10.0));
    }

    SECTION("Report inside the interval is suppressed") {
        auto s = compute_progress(20, 100, t0, t0 + 1s, t0 + 3s, 5s);
        CHECK_FALSE(s.has_value());
    }

    SECTION("Report after the interval is due") {
        auto s = compute_progress(60, 100, t0, t0 + 1s, t0 + 6s, 5s);
        CHECK(s.has_value());
    }

    SECTION("Completion is always due") {
        auto s = compute_progress(100, 100, t0, t0 + 1s, t0 + 1100ms, 5s);
        REQUIRE(s.has_value());
        CHECK(s->percent == Catch::Approx(100.0));
        CHECK(s->eta_seconds == 0);
    }
}

TEST_CASE("compute_progress - speed and ETA", "[progress]") {
    auto t0 = Clock::time_point{} + 1h;

    auto s = compute_progress(1000, 5000, t0, std::nullopt, t0 + 10s, 5s);
    REQUIRE(s.has_value());
    CHECK(s->speed_bps == 100);
    CHECK(s->eta_seconds == 40);

    SECTION("Unknown total") {
        auto u = compute_progress(1000, 0, t0, std::nullopt, t0 + 10s, 5s);
        REQUIRE(u.has_value());
        CHECK(u->percent == 0.0);
        CHECK(u->eta_seconds == 0);
    }

    SECTION("Empty transfer completes") {
        auto e = compute_progress(0, 0, t0, t0 + 1s, t0 + 1100ms, 5s);
        REQUIRE(e.has_value());
        CHECK(e->percent == Catch::Approx(100.0));
        CHECK(e->eta_seconds == 0);

        // Unknown total stays rate limited
        CHECK_FALSE(compute_progress(1000, 0, t0, t0 + 1s, t0 + 1100ms, 5s).has_value());
    }

    SECTION("No elapsed time means no speed") {
        auto z = compute_progress(1000, 5000, t0, std::nullopt, t0, 5s);
        REQUIRE(z.has_value());
        CHECK(z->speed_bps == 0);
        CHECK(z->eta_seconds == 0);
    }
}

TEST_CASE("ProgressReporter", "[progress]") {
    auto now = Clock::time_point{} + 1h;
    auto clock = [&now] { return now; };

    SECTION("Emits first, rate limits, always emits completion") {
        std::vector<ProgressSample> seen;
        ProgressReporter reporter([&](const ProgressSample& s) { seen.push_back(s); }, 5000ms, clock);

        now += 1s;
        CHECK(reporter.report(10, 100));
        now += 1s;
        CHECK_FALSE(reporter.report(20, 100));
        now += 5s;
        CHECK(reporter.report(70, 100));
        now += 1s;
        CHECK(reporter.report(100, 100));

        REQUIRE(seen.size() == 3);
        CHECK(seen.back().current == 100);
        CHECK(reporter.emitted() == 3);
    }

    SECTION("Sink failures never escape") {
        ProgressReporter reporter([](const ProgressSample&) {
            throw std::runtime_error("status message gone");
        }, 0ms, clock);

        CHECK_NOTHROW(reporter.report(1, 2));
        CHECK_NOTHROW(reporter.report(2, 2));
        CHECK(reporter.emitted() == 2);
    }

    SECTION("Callback adapter feeds the reporter") {
        int calls = 0;
        ProgressReporter reporter([&](const ProgressSample&) { ++calls; }, 0ms, clock);
        auto fn = reporter.as_callback();
        fn(5, 10);
        fn(10, 10);
        CHECK(calls == 2);
    }

    SECTION("Zero-byte completion reaches the sink") {
        std::vector<ProgressSample> seen;
        ProgressReporter reporter([&](const ProgressSample& s) { seen.push_back(s); }, 5000ms, clock);
        now += 1s;
        CHECK(reporter.report(0, 0));
        now += 1s;
        CHECK(reporter.report(0, 0));
        REQUIRE(seen.size() == 2);
        CHECK(seen.back().percent == Catch::Approx(100.0));
    }

    SECTION("Empty sink is a no-op") {
        ProgressReporter reporter(nullptr, 0ms, clock);
        CHECK_FALSE(reporter.report(1, 1));
    }
}

TEST_CASE("ProgressReporter::report may throw", "[progress]") {
    STATIC_REQUIRE_FALSE(noexcept(std::declval<ProgressReporter&>().report(0, 0)));
}

TEST_CASE("Human readable formatting", "[progress]") {
    CHECK(human_bytes(512) == "512 B");
    CHECK(human_bytes(1024 * 1024) == "1.00 MB");
    CHECK(human_speed(2048) == "2.00 KB/s");
    CHECK(human_time(59) == "59s");
    CHECK(human_time(61) == "1m 1s");
    CHECK(human_time(3725) == "1h 2m 5s");
}
