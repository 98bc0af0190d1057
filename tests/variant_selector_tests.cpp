// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/media/variant_selector.hpp>
#include "test_support.hpp"

using namespace ferry::media;
using ferry::core::TaskErrc;
using ferry::test::FakeFetcher;
using ferry::test::FakeMediaTool;
using ferry::test::TempDir;
namespace fs = std::filesystem;

namespace {

constexpr const char* MASTER_URL = "https://cdn.example.com/show/movie.m3u8";

constexpr std::string_view MASTER =
    "#EXTM3U\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=2800000,RESOLUTION=1280x720\n"
    "hd/index.m3u8\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=800000\n"
    "low/index.m3u8\n";

} // namespace

TEST_CASE("Variant labels", "[variants]") {
    HLSVariant v;
    CHECK(variant_label(v) == "Variant");
    v.bandwidth = 800000;
    CHECK(variant_label(v) == "800kbps");
    v.height = 1080;
    CHECK(variant_label(v) == "1080p");
}

TEST_CASE("Manifest base names", "[variants]") {
    CHECK(manifest_base_name("https://a.com/show/movie.m3u8?token=1") == "movie");
    CHECK(manifest_base_name("https://a.com/live/INDEX.M3U8") == "INDEX");
    CHECK(manifest_base_name("https://a.com/") == "stream");
    CHECK(manifest_base_name("garbage") == "stream");
}

TEST_CASE("Choosing a quality from a master playlist", "[variants]") {
    TempDir dir;
    FakeFetcher fetcher;
    fetcher.bodies[MASTER_URL] = std::string(MASTER);
    FakeMediaTool tool;
    StreamVariantSelector selector(fetcher, tool);

    auto task = selector.offer(4, MASTER_URL, dir.path());
    REQUIRE(task.has_value());
    REQUIRE(task->variants.size() == 2);
    CHECK(task->variants[0].label == "720p");
    CHECK(task->variants[1].label == "800kbps");
    CHECK(task->base_name == "movie");
    CHECK(selector.pending() == 1);

    SECTION("Owner picks the first entry") {
        auto out = selector.choose(task->id, 0, 4);
        REQUIRE(out.has_value());
        CHECK(out->filename().string() == "movie_720p.mp4");
        CHECK(fs::exists(*out));
        CHECK(tool.remuxed == std::vector<std::string>{"https://cdn.example.com/show/hd/index.m3u8"});
        CHECK(selector.pending() == 0);

        auto again = selector.choose(task->id, 0, 4);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().is(TaskErrc::task_not_found));
    }

    SECTION("A stranger cannot choose") {
        auto out = selector.choose(task->id, 0, 5);
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error().is(TaskErrc::not_owner));
        CHECK(selector.find(task->id).has_value());
        CHECK(tool.remuxed.empty());
    }

    SECTION("Out of range index keeps the task") {
        auto out = selector.choose(task->id, 2, 4);
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error().is(TaskErrc::invalid_index));
        CHECK(selector.pending() == 1);
    }

    SECTION("A failed remux still consumes the task") {
        tool.failure = ferry::core::Failure(TaskErrc::process_failed, "Server returned 403 Forbidden");
        auto out = selector.choose(task->id, 1, 4);
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error().is(TaskErrc::process_failed));
        CHECK(selector.pending() == 0);
    }

    SECTION("Discard") {
        CHECK(selector.discard(task->id));
        CHECK_FALSE(selector.discard(task->id));
    }
}

TEST_CASE("A leaf playlist offers a single Auto entry", "[variants]") {
    TempDir dir;
    FakeFetcher fetcher;
    fetcher.bodies["https://a.com/clip.m3u8"] = "#EXTM3U\n#EXTINF:4,\nseg.ts\n#EXT-X-ENDLIST\n";
    FakeMediaTool tool;
    StreamVariantSelector selector(fetcher, tool);

    auto variants = selector.resolve_variants("https://a.com/clip.m3u8");
    REQUIRE(variants.has_value());
    REQUIRE(variants->size() == 1);
    CHECK((*variants)[0].label == "Auto");
    CHECK((*variants)[0].url == "https://a.com/clip.m3u8");
}

TEST_CASE("Same-named manifests in one directory keep separate outputs", "[variants]") {
    TempDir dir;
    FakeFetcher fetcher;
    fetcher.bodies["https://a.com/index.m3u8"] = "#EXTM3U\n#EXTINF:4,\na.ts\n#EXT-X-ENDLIST\n";
    fetcher.bodies["https://b.com/index.m3u8"] = "#EXTM3U\n#EXTINF:4,\nb.ts\n#EXT-X-ENDLIST\n";
    FakeMediaTool tool;
    StreamVariantSelector selector(fetcher, tool);

    auto first = selector.offer(4, "https://a.com/index.m3u8", dir.path());
    auto second = selector.offer(4, "https://b.com/index.m3u8", dir.path());
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    auto out_a = selector.choose(first->id, 0, 4);
    auto out_b = selector.choose(second->id, 0, 4);
    REQUIRE(out_a.has_value());
    REQUIRE(out_b.has_value());

    CHECK(out_a->filename().string() == "index_Auto.mp4");
    CHECK(out_b->filename().string() == "index_Auto.mp4");
    CHECK(out_a->string() != out_b->string());
    CHECK(fs::exists(*out_a));
    CHECK(fs::exists(*out_b));
    CHECK(out_a->parent_path().parent_path().string() == dir.path().string());
}

TEST_CASE("Offer failures", "[variants]") {
    TempDir dir;
    FakeFetcher fetcher;
    fetcher.bodies["https://a.com/page.m3u8"] = "<html></html>";
    FakeMediaTool tool;
    StreamVariantSelector selector(fetcher, tool);

    auto bad = selector.offer(1, "https://a.com/page.m3u8", dir.path());
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().is(TaskErrc::manifest_invalid));

    auto unreachable = selector.offer(1, "https://a.com/gone.m3u8", dir.path());
    REQUIRE_FALSE(unreachable.has_value());
    CHECK(unreachable.error().is(TaskErrc::network_error));
    CHECK(selector.pending() == 0);
}
