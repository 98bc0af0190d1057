// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/cli/progress_bar.hpp>
#include <sstream>

using ferry::cli::ProgressBar;
using ferry::core::ProgressSample;

namespace {

ProgressSample sample(std::uint64_t current, std::uint64_t total, double percent,
                      std::uint64_t speed = 0, std::uint64_t eta = 0) {
    ProgressSample s;
    s.current = current;
    s.total = total;
    s.percent = percent;
    s.speed_bps = speed;
    s.eta_seconds = eta;
    return s;
}

} // namespace

TEST_CASE("ProgressBar::render", "[progress_bar]") {
    std::ostringstream out;
    ProgressBar bar(out, "movie.mp4");

    SECTION("Half way with speed and ETA") {
        CHECK(bar.render(sample(512, 1024, 50.0, 2048, 59)) ==
              "movie.mp4: [===============>               ]  50% (512 B/1.00 KB) @ 2.00 KB/s ETA: 59s");
    }

    SECTION("Empty and complete") {
        auto start = bar.render(sample(0, 1024, 0.0));
        CHECK(start.starts_with("movie.mp4: [>"));
        CHECK(start.ends_with("   0% (0 B/1.00 KB)"));

        auto done = bar.render(sample(1024, 1024, 100.0));
        CHECK(done.find("[==============================>]") != std::string::npos);
        CHECK(done.find(" 100% ") != std::string::npos);
    }

    SECTION("No label") {
        bar.label("");
        CHECK(bar.render(sample(0, 0, 0.0)).starts_with("[>"));
    }
}

TEST_CASE("ProgressBar redraws on whole-percent changes", "[progress_bar]") {
    std::ostringstream out;
    ProgressBar bar(out, "x");

    bar.update(sample(10, 100, 10.0));
    auto after_first = out.str().size();
    bar.update(sample(10, 100, 10.4));
    CHECK(out.str().size() == after_first);

    bar.update(sample(11, 100, 11.0));
    CHECK(out.str().size() > after_first);

    bar.finish();
    CHECK(out.str().back() == '\n');

    // Nothing to finish twice
    auto final_size = out.str().size();
    bar.finish();
    bar.clear();
    CHECK(out.str().size() == final_size);
}
