// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/settings.hpp>
#include "test_support.hpp"
#include <cstdlib>

using namespace ferry::core;
using ferry::test::TempDir;
using ferry::test::write_file;

TEST_CASE("Settings defaults", "[settings]") {
    Settings s;
    CHECK(s.temp_dir.string() == "./ferry-tmp");
    CHECK(s.ttl_minutes == DEFAULT_TTL_MINUTES);
    CHECK(s.sweep_interval == SWEEP_INTERVAL);
    CHECK(s.cloud_drive_domain == "drive.google.com");
    CHECK(s.platform_domains == std::vector<std::string>{"t.me", "telegram.me"});
    CHECK(s.user_store.empty());
}

TEST_CASE("Settings::parse", "[settings]") {
    SECTION("Known keys override defaults, unknown keys are ignored") {
        auto s = Settings::parse(R"({
            "temp_dir": "/var/tmp/ferry",
            "ttl_minutes": 5,
            "sweep_interval_seconds": 60,
            "log_level": "debug",
            "seven_zip": "/usr/bin/7za",
            "platform_domains": ["t.me"],
            "broadcast_channel": 42
        })");
        REQUIRE(s.has_value());
        CHECK(s->temp_dir.string() == "/var/tmp/ferry");
        CHECK(s->ttl_minutes == 5);
        CHECK(s->sweep_interval == std::chrono::seconds(60));
        CHECK(s->log_level == "debug");
        CHECK(s->seven_zip == "/usr/bin/7za");
        CHECK(s->platform_domains.size() == 1);
    }

    SECTION("Wrong type names the key") {
        auto s = Settings::parse(R"({"ttl_minutes": "thirty"})");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error().detail.find("ttl_minutes") != std::string::npos);
    }

    SECTION("Not an object") {
        CHECK_FALSE(Settings::parse("[1, 2]").has_value());
        CHECK_FALSE(Settings::parse("{broken").has_value());
    }

    SECTION("Zero sweep interval is rejected") {
        CHECK_FALSE(Settings::parse(R"({"sweep_interval_seconds": 0})").has_value());
    }
}

TEST_CASE("Settings::load", "[settings]") {
    TempDir dir;

    SECTION("Missing file yields defaults") {
        auto s = Settings::load(dir / "absent.json");
        REQUIRE(s.has_value());
        CHECK(s->ttl_minutes > 0);
    }

    SECTION("Environment overrides the file") {
        write_file(dir / "ferry.json", R"({"ttl_minutes": 10, "temp_dir": "/from/file"})");
        ::setenv("FERRY_TTL_MINUTES", "3", 1);
        ::setenv("FERRY_TEMP_DIR", "/from/env", 1);

        auto s = Settings::load(dir / "ferry.json");

        ::unsetenv("FERRY_TTL_MINUTES");
        ::unsetenv("FERRY_TEMP_DIR");

        REQUIRE(s.has_value());
        CHECK(s->ttl_minutes == 3);
        CHECK(s->temp_dir.string() == "/from/env");
    }

    SECTION("Malformed file fails") {
        write_file(dir / "bad.json", R"({"ffmpeg": 7})");
        auto s = Settings::load(dir / "bad.json");
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error().detail.find("ffmpeg") != std::string::npos);
    }
}
