// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/engine/messenger.hpp>
#include <sstream>

namespace ferry::engine {

std::string progress_text(const std::string& label, const core::ProgressSample& sample) {
    std::ostringstream ss;
    if (!label.empty()) {
        ss << label << "\n";
    }
    ss << static_cast<int>(sample.percent) << "% | "
       << core::human_bytes(sample.current) << " / " << core::human_bytes(sample.total) << " | "
       << core::human_speed(sample.speed_bps);
    if (sample.eta_seconds > 0) {
        ss << " | ETA " << core::human_time(sample.eta_seconds);
    }
    return ss.str();
}

std::expected<void, core::Failure>
Messenger::report_progress(StatusId status, const std::string& label, const core::ProgressSample& sample) {
    return edit_status(status, progress_text(label, sample));
}

} // namespace ferry::engine
