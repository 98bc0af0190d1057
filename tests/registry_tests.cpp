// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/resource_registry.hpp>
#include <ferry/core/sweeper.hpp>
#include "test_support.hpp"

using namespace ferry::core;
using ferry::test::TempDir;
using ferry::test::write_file;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

TEST_CASE("Sweep honours the TTL", "[registry]") {
    TempDir dir;
    auto scratch = dir / "42" / "job";
    fs::create_directories(scratch);
    write_file(scratch / "out.bin", "payload");

    ResourceRegistry registry;
    auto t0 = ResourceRegistry::Clock::now();
    registry.register_path(42, scratch, 1min, t0);

    SECTION("Not yet expired") {
        auto report = registry.sweep(t0 + 30s);
        CHECK(report.empty());
        CHECK(fs::exists(scratch / "out.bin"));
        CHECK(registry.size() == 1);
    }

    SECTION("Expired") {
        auto report = registry.sweep(t0 + 61s);
        REQUIRE(report.removed.size() == 1);
        REQUIRE(report.deleted.size() == 1);
        CHECK_FALSE(fs::exists(scratch));
        CHECK(registry.size() == 0);

        // Second pass finds nothing to do
        CHECK(registry.sweep(t0 + 120s).empty());
    }

    SECTION("Boundary is inclusive") {
        CHECK_FALSE(registry.sweep(t0 + 60s).empty());
    }
}

TEST_CASE("Missing paths count as clean", "[registry]") {
    TempDir dir;
    ResourceRegistry registry;
    auto t0 = ResourceRegistry::Clock::now();
    registry.register_path(1, dir / "never-created", 1min, t0);

    auto report = registry.sweep(t0 + 2min);
    CHECK(report.removed.size() == 1);
    CHECK(report.deleted.empty());
    CHECK(report.errors.empty());
    CHECK(registry.size() == 0);
}

TEST_CASE("A path that cannot be removed keeps its record", "[registry]") {
    // procfs entries refuse unlink, even for root
    const fs::path stuck = "/proc/self/status";
    if (!fs::exists(stuck)) {
        SKIP("procfs not mounted");
    }

    TempDir dir;
    ResourceRegistry registry(dir / "registry.json");
    auto t0 = ResourceRegistry::Clock::now();
    registry.register_path(7, stuck, 1min, t0);
    registry.register_path(7, dir / "gone", 1min, t0);

    auto first = registry.sweep(t0 + 2min);
    CHECK(first.removed.size() == 1);
    CHECK(first.deleted.empty());
    REQUIRE(first.errors.size() == 1);
    CHECK_FALSE(first.empty());
    CHECK(registry.size() == 1);
    CHECK(registry.tracks(stuck));

    // Retried on the next pass, and survives a restart through the journal
    auto second = registry.sweep(t0 + 3min);
    CHECK(second.removed.empty());
    CHECK(second.errors.size() == 1);
    CHECK(registry.size() == 1);

    ResourceRegistry reloaded(dir / "registry.json");
    CHECK(reloaded.size() == 1);
}

TEST_CASE("A live duplicate keeps the path", "[registry]") {
    TempDir dir;
    auto scratch = dir / "shared";
    fs::create_directories(scratch);

    ResourceRegistry registry;
    auto t0 = ResourceRegistry::Clock::now();
    registry.register_path(1, scratch, 1min, t0);
    registry.register_path(1, scratch, 10min, t0);

    auto report = registry.sweep(t0 + 2min);
    CHECK(report.removed.size() == 1);
    CHECK(fs::exists(scratch));
    CHECK(registry.tracks(scratch / "child.txt"));

    registry.sweep(t0 + 11min);
    CHECK_FALSE(fs::exists(scratch));
}

TEST_CASE("Registry queries", "[registry]") {
    TempDir dir;
    ResourceRegistry registry;
    registry.register_path(1, dir / "a", 5min);
    registry.register_path(2, dir / "b", 5min);
    registry.register_path(1, dir / "c", 5min);

    CHECK(registry.size() == 3);
    CHECK(registry.records_for(1).size() == 2);
    CHECK(registry.records_for(3).empty());
    CHECK(registry.tracks(dir / "b"));
    CHECK(registry.tracks(dir / "a" / "x" / "y.txt"));
    CHECK_FALSE(registry.tracks(dir / "d"));
}

TEST_CASE("Journal survives a restart", "[registry]") {
    TempDir dir;
    auto journal = dir / "state" / "registry.json";
    auto scratch = dir / "7" / "job";
    fs::create_directories(scratch);

    auto t0 = ResourceRegistry::Clock::now();
    RecordId first = 0;
    {
        ResourceRegistry registry(journal);
        first = registry.register_path(7, scratch, 1min, t0);
        CHECK(registry.journal_error().empty());
    }
    REQUIRE(fs::exists(journal));

    ResourceRegistry reloaded(journal);
    REQUIRE(reloaded.size() == 1);
    auto records = reloaded.records();
    CHECK(records[0].id == first);
    CHECK(records[0].owner == 7);
    CHECK(records[0].ttl == 1min);

    // Ids keep increasing after reload
    CHECK(reloaded.register_path(7, dir / "other", 1min, t0) > first);

    // Orphans from the previous run are swept
    reloaded.sweep(t0 + 5min);
    CHECK_FALSE(fs::exists(scratch));
    CHECK(ResourceRegistry(journal).size() == 0);
}

TEST_CASE("Unreadable journal starts empty", "[registry]") {
    TempDir dir;
    write_file(dir / "registry.json", "not json");

    ResourceRegistry registry(dir / "registry.json");
    CHECK(registry.size() == 0);
    CHECK_FALSE(registry.journal_error().empty());
}

TEST_CASE("Sweeper pass cleans the registry and idle slots", "[registry][sweeper]") {
    TempDir dir;
    auto scratch = dir / "old";
    std::filesystem::create_directories(scratch);

    ResourceRegistry registry;
    TaskCoordinator coordinator;
    registry.register_path(1, scratch, 1min, ResourceRegistry::Clock::now() - 10min);
    REQUIRE(coordinator.try_begin(1).has_value());
    coordinator.end(1);
    REQUIRE(coordinator.try_begin(2).has_value());

    Sweeper sweeper(registry, coordinator, std::chrono::seconds(60), std::chrono::seconds(0));
    auto report = sweeper.run_once();

    CHECK(report.removed.size() == 1);
    CHECK_FALSE(fs::exists(scratch));
    CHECK(sweeper.passes() == 1);
    CHECK(coordinator.size() == 1);
    CHECK(coordinator.busy(2));
    coordinator.end(2);
}

TEST_CASE("Sweeper thread starts and stops promptly", "[registry][sweeper]") {
    ResourceRegistry registry;
    TaskCoordinator coordinator;
    Sweeper sweeper(registry, coordinator, std::chrono::seconds(3600));

    sweeper.start();
    CHECK(sweeper.running());

    auto t0 = std::chrono::steady_clock::now();
    sweeper.stop();
    CHECK_FALSE(sweeper.running());
    CHECK(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(5));
    CHECK(sweeper.passes() == 0);
}
