// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/progress.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace ferry::cli {

// Single-line terminal progress bar
class ProgressBar {
public:
    explicit ProgressBar(std::ostream& out, std::string_view label = {});

    // Redraw from a sample; skipped unless the whole percent changed
    void update(const core::ProgressSample& sample);

    // End the line of a bar that is showing
    void finish();

    // Erase the current line
    void clear();

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l);

    // Rendered line without the leading carriage return
    [[nodiscard]] std::string render(const core::ProgressSample& sample) const;

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::ostream& out_;
    std::string label_;
    int last_percent_{-1};
    bool active_{false};
};

} // namespace ferry::cli
