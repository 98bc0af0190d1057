// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/progress.hpp>
#include <ferry/core/log.hpp>
#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>

namespace ferry::core {

std::optional<ProgressSample> compute_progress(
    std::uint64_t current,
    std::uint64_t total,
    std::chrono::steady_clock::time_point started_at,
    std::optional<std::chrono::steady_clock::time_point> last_emit_at,
    std::chrono::steady_clock::time_point now,
    std::chrono::milliseconds min_interval) noexcept {

    // 0/0 is a finished empty transfer
    const bool complete = total > 0 ? current >= total : current == 0;
    if (!complete && last_emit_at && now - *last_emit_at < min_interval) {
        return std::nullopt;
    }

    ProgressSample sample;
    sample.current = current;
    sample.total = total;

    if (total > 0) {
        sample.percent = std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total),
                                    0.0, 100.0);
    } else if (complete) {
        sample.percent = 100.0;
    }

    auto elapsed = std::chrono::duration<double>(now - started_at).count();
    if (elapsed > 0.0) {
        sample.speed_bps = static_cast<std::uint64_t>(static_cast<double>(current) / elapsed);
    }

    if (sample.speed_bps > 0 && total > current) {
        sample.eta_seconds = (total - current) / sample.speed_bps;
    }

    return sample;
}

//=============================================================================
// ProgressReporter
//=============================================================================

ProgressReporter::ProgressReporter(ProgressSink sink,
                                   std::chrono::milliseconds min_interval,
                                   std::function<Clock::time_point()> clock)
    : sink_(std::move(sink))
    , min_interval_(min_interval)
    , clock_(std::move(clock))
    , started_at_(clock_()) {}

bool ProgressReporter::report(std::uint64_t current, std::uint64_t total) {
    if (!sink_) return false;

    auto now = clock_();
    auto sample = compute_progress(current, total, started_at_, last_emit_at_, now, min_interval_);
    if (!sample) return false;

    last_emit_at_ = now;
    ++emitted_;

    try {
        sink_(*sample);
    } catch (const std::exception& e) {
        // Status surface may be gone; progress is best effort
        logger("progress")->debug("progress sink failed: {}", e.what());
    }
    return true;
}

ProgressFn ProgressReporter::as_callback() {
    return [this](std::uint64_t current, std::uint64_t total) {
        report(current, total);
    };
}

//=============================================================================
// Formatting
//=============================================================================

std::string human_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (bytes >= TB) {
        ss << (static_cast<double>(bytes) / TB) << " TB";
    } else if (bytes >= GB) {
        ss << (static_cast<double>(bytes) / GB) << " GB";
    } else if (bytes >= MB) {
        ss << (static_cast<double>(bytes) / MB) << " MB";
    } else if (bytes >= KB) {
        ss << (static_cast<double>(bytes) / KB) << " KB";
    } else {
        return std::to_string(bytes) + " B";
    }
    return ss.str();
}

std::string human_speed(std::uint64_t bps) {
    return human_bytes(bps) + "/s";
}

std::string human_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace ferry::core
