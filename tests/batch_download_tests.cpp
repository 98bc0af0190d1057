// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/pipeline/batch_download.hpp>
#include "test_support.hpp"

using namespace ferry::pipeline;
using ferry::core::CancelToken;
using ferry::core::Failure;
using ferry::core::TaskErrc;
using ferry::links::LinkGroups;
using ferry::test::FakeFetcher;
using ferry::test::FakeMediaTool;
using ferry::test::TempDir;
namespace fs = std::filesystem;

namespace {

struct Fixture {
    TempDir dir;
    FakeFetcher fetcher;
    FakeMediaTool tool;
    ferry::media::StreamVariantSelector selector{fetcher, tool};
    BatchDownloadPipeline pipeline{fetcher, selector};

    BatchOptions options() const {
        BatchOptions o;
        o.dest_dir = dir.path();
        o.progress_interval = std::chrono::milliseconds(0);
        return o;
    }
};

} // namespace

TEST_CASE("One failing item does not stop the batch", "[batch]") {
    Fixture f;
    f.fetcher.bodies["https://a.com/1.zip"] = "one";
    f.fetcher.failures["https://a.com/2.zip"] = Failure(TaskErrc::http_error, "404");
    f.fetcher.bodies["https://a.com/3.zip"] = "three";

    LinkGroups groups;
    groups.direct = {"https://a.com/1.zip", "https://a.com/2.zip", "https://a.com/3.zip"};

    std::vector<std::size_t> positions;
    std::vector<fs::path> delivered;
    BatchHooks hooks;
    hooks.on_item = [&](std::size_t idx, std::size_t count, const std::string&) {
        positions.push_back(idx);
        CHECK(count == 3);
    };
    hooks.on_file = [&](const fs::path& p) -> std::expected<void, Failure> {
        delivered.push_back(p);
        return {};
    };

    auto result = f.pipeline.run(1, groups, f.options(), CancelToken{}, hooks);
    REQUIRE(result.has_value());
    CHECK(result->ok == 2);
    CHECK(result->fail == 1);
    CHECK_FALSE(result->cancelled);
    CHECK(result->ok + result->fail == 3);

    CHECK(f.fetcher.requested == groups.direct);
    CHECK(positions == std::vector<std::size_t>{1, 2, 3});
    CHECK(delivered.size() == 2);
    REQUIRE(result->failures.size() == 1);
    CHECK(result->failures[0].url == "https://a.com/2.zip");
    CHECK(result->failures[0].failure.is(TaskErrc::http_error));
    CHECK(ferry::test::read_file(f.dir / "3.zip") == "three");
}

TEST_CASE("Fetch order is drive, direct, unknown, then manifests", "[batch]") {
    Fixture f;
    const std::string drive_fetch = std::string(ferry::core::CLOUD_DRIVE_DOWNLOAD) + "ID1";
    f.fetcher.bodies[drive_fetch] = "drive";
    f.fetcher.bodies["https://a.com/v.mp4"] = "video";
    f.fetcher.bodies["https://a.com/page"] = "html";
    f.fetcher.bodies["https://a.com/live.m3u8"] = "#EXTM3U\n#EXTINF:4,\nseg.ts\n";

    LinkGroups groups;
    groups.unknown = {"https://a.com/page"};
    groups.streaming_manifest = {"https://a.com/live.m3u8"};
    groups.direct = {"https://a.com/v.mp4"};
    groups.cloud_drive = {"https://drive.google.com/file/d/ID1/view"};
    groups.platform_internal = {"https://t.me/c/1"};

    std::vector<std::string> selections;
    BatchHooks hooks;
    hooks.on_selection = [&](const ferry::media::StreamSelectionTask& task) {
        selections.push_back(task.manifest_url);
    };

    auto result = f.pipeline.run(9, groups, f.options(), CancelToken{}, hooks);
    REQUIRE(result.has_value());
    CHECK(f.fetcher.requested == std::vector<std::string>{
        drive_fetch, "https://a.com/v.mp4", "https://a.com/page", "https://a.com/live.m3u8"});
    CHECK(result->ok == 3);
    CHECK(result->fail == 0);
    CHECK(result->skipped_internal == 1);
    REQUIRE(result->selections.size() == 1);
    CHECK(result->selections[0].owner == 9);
    CHECK(selections == std::vector<std::string>{"https://a.com/live.m3u8"});
    CHECK(f.selector.pending() == 1);
}

TEST_CASE("Unresolvable drive links fail without a request", "[batch]") {
    Fixture f;
    LinkGroups groups;
    groups.cloud_drive = {"https://drive.google.com/drive/folders/xyz"};

    auto result = f.pipeline.run(1, groups, f.options(), CancelToken{});
    REQUIRE(result.has_value());
    CHECK(result->fail == 1);
    CHECK(result->ok == 0);
    CHECK(f.fetcher.requested.empty());
    REQUIRE(result->failures.size() == 1);
    CHECK(result->failures[0].failure.is(TaskErrc::unresolvable_link));
}

TEST_CASE("Cancellation is checked before each item", "[batch]") {
    Fixture f;
    f.fetcher.bodies["https://a.com/1.zip"] = "1";
    f.fetcher.bodies["https://a.com/2.zip"] = "2";
    f.fetcher.bodies["https://a.com/3.zip"] = "3";

    LinkGroups groups;
    groups.direct = {"https://a.com/1.zip", "https://a.com/2.zip", "https://a.com/3.zip"};
    groups.streaming_manifest = {"https://a.com/x.m3u8"};

    CancelToken token;
    f.fetcher.after_download = [&](const std::string&) { token.cancel(); };

    auto result = f.pipeline.run(1, groups, f.options(), token);
    REQUIRE(result.has_value());
    CHECK(result->cancelled);
    CHECK(result->ok == 1);
    CHECK(result->fail == 0);
    CHECK(f.fetcher.requested.size() == 1);
    CHECK(result->selections.empty());
}

TEST_CASE("A failed hand-off counts the item as failed", "[batch]") {
    Fixture f;
    f.fetcher.bodies["https://a.com/big.mkv"] = "movie";

    LinkGroups groups;
    groups.direct = {"https://a.com/big.mkv"};

    BatchHooks hooks;
    hooks.on_file = [](const fs::path&) -> std::expected<void, Failure> {
        return std::unexpected(Failure(TaskErrc::network_error, "upload rejected"));
    };

    auto result = f.pipeline.run(1, groups, f.options(), CancelToken{}, hooks);
    REQUIRE(result.has_value());
    CHECK(result->ok == 0);
    CHECK(result->fail == 1);
    CHECK(result->files.empty());
}

TEST_CASE("Progress reaches the hook", "[batch]") {
    Fixture f;
    f.fetcher.bodies["https://a.com/1.zip"] = std::string(2048, 'x');

    LinkGroups groups;
    groups.direct = {"https://a.com/1.zip"};

    std::vector<ferry::core::ProgressSample> samples;
    BatchHooks hooks;
    hooks.on_progress = [&](const ferry::core::ProgressSample& s) { samples.push_back(s); };

    auto result = f.pipeline.run(1, groups, f.options(), CancelToken{}, hooks);
    REQUIRE(result.has_value());
    REQUIRE_FALSE(samples.empty());
    CHECK(samples.back().current == 2048);
    CHECK(samples.back().percent == Catch::Approx(100.0));
}

TEST_CASE("Nothing fetchable", "[batch]") {
    Fixture f;
    LinkGroups groups;
    groups.platform_internal = {"https://t.me/c/1"};

    auto result = f.pipeline.run(1, groups, f.options(), CancelToken{});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().is(TaskErrc::no_links));
    CHECK(BatchDownloadPipeline::fetch_candidates(groups) == 0);
}

TEST_CASE("Manifest failures are reported separately", "[batch]") {
    Fixture f;
    f.fetcher.bodies["https://a.com/bad.m3u8"] = "nope";

    LinkGroups groups;
    groups.streaming_manifest = {"https://a.com/bad.m3u8"};

    auto result = f.pipeline.run(1, groups, f.options(), CancelToken{});
    REQUIRE(result.has_value());
    CHECK(result->ok == 0);
    CHECK(result->fail == 0);
    REQUIRE(result->manifest_failures.size() == 1);
    CHECK(result->manifest_failures[0].failure.is(TaskErrc::manifest_invalid));
}
