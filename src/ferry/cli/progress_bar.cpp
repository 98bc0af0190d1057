// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>

namespace ferry::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

ProgressBar::ProgressBar(std::ostream& out, std::string_view label)
    : out_(out)
    , label_(label) {}

void ProgressBar::label(std::string_view l) {
    label_ = l;
    last_percent_ = -1;
}

void ProgressBar::update(const core::ProgressSample& sample) {
    auto pct = static_cast<int>(std::clamp(sample.percent, 0.0, 100.0));
    if (pct == last_percent_) return;
    last_percent_ = pct;

    // Pad so a shorter line fully covers the previous one
    out_ << "\r" << render(sample) << std::string(8, ' ') << std::flush;
    active_ = true;
}

void ProgressBar::finish() {
    if (!active_) return;
    out_ << std::endl;
    active_ = false;
    last_percent_ = -1;
}

void ProgressBar::clear() {
    if (!active_) return;
    out_ << "\r" << std::string(80, ' ') << "\r" << std::flush;
    active_ = false;
    last_percent_ = -1;
}

std::string ProgressBar::render(const core::ProgressSample& sample) const {
    double percent = std::clamp(sample.percent, 0.0, 100.0);

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }
    line += render_bar(percent);

    auto pct_int = static_cast<int>(percent);
    line += " ";
    if (pct_int < 10) line += " ";
    if (pct_int < 100) line += " ";
    line += std::to_string(pct_int) + "%";

    line += " (" + core::human_bytes(sample.current) + "/" + core::human_bytes(sample.total) + ")";

    if (sample.speed_bps > 0) {
        line += " @ " + core::human_speed(sample.speed_bps);
    }
    if (sample.eta_seconds > 0) {
        line += " ETA: " + core::human_time(sample.eta_seconds);
    }
    return line;
}

std::string ProgressBar::render_bar(double percent) {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));
    const int empty = BAR_WIDTH - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(empty), ' ');
    bar += ']';
    return bar;
}

} // namespace ferry::cli
