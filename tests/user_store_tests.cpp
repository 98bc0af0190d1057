// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/user_store.hpp>
#include "test_support.hpp"

using namespace ferry::core;
using ferry::test::TempDir;

TEST_CASE("get_or_create_user is idempotent", "[users]") {
    UserStore store;

    auto u = store.get_or_create_user(10, "2026-03-01");
    CHECK(u.id == 10);
    CHECK_FALSE(u.premium);
    CHECK_FALSE(u.banned);
    CHECK(u.auto_delete_minutes == DEFAULT_TTL_MINUTES);

    store.get_or_create_user(10, "2026-03-01");
    CHECK(store.count().total == 1);
    CHECK_FALSE(store.find(11).has_value());
}

TEST_CASE("Daily counters reset on a new day", "[users]") {
    UserStore store;
    store.record_task_stats(5, 12.5, "2026-03-01");
    store.record_task_stats(5, 2.5, "2026-03-01");

    auto same_day = store.get_or_create_user(5, "2026-03-01");
    CHECK(same_day.daily_tasks == 2);
    CHECK(same_day.daily_size_mb == Catch::Approx(15.0));
    CHECK(same_day.total_tasks == 2);
    CHECK(same_day.last_task_at > 0);

    auto next_day = store.get_or_create_user(5, "2026-03-02");
    CHECK(next_day.daily_tasks == 0);
    CHECK(next_day.daily_size_mb == 0.0);
    CHECK(next_day.total_tasks == 2);
}

TEST_CASE("Flags and preferences", "[users]") {
    UserStore store;
    store.set_default_auto_delete(45);

    CHECK_FALSE(store.is_banned(1));
    store.set_banned(1, true);
    store.set_premium(2, true);
    store.set_auto_delete(3, 90);

    CHECK(store.is_banned(1));
    CHECK(store.find(2)->premium);
    CHECK(store.find(3)->auto_delete_minutes == 90);
    CHECK(store.find(1)->auto_delete_minutes == 45);

    auto counts = store.count();
    CHECK(counts.total == 3);
    CHECK(counts.premium == 1);
    CHECK(counts.banned == 1);

    store.set_banned(1, false);
    CHECK_FALSE(store.is_banned(1));
}

TEST_CASE("Store persists to its file", "[users]") {
    TempDir dir;
    auto file = dir / "users.json";
    {
        UserStore store(file);
        store.set_premium(77, true);
        store.record_task_stats(77, 1.0, "2026-03-01");
    }

    UserStore reloaded(file);
    auto u = reloaded.find(77);
    REQUIRE(u.has_value());
    CHECK(u->premium);
    CHECK(u->total_tasks == 1);
    CHECK(u->day == "2026-03-01");
}

TEST_CASE("today_string is an ISO date", "[users]") {
    auto today = UserStore::today_string();
    REQUIRE(today.size() == 10);
    CHECK(today[4] == '-');
    CHECK(today[7] == '-');
}
