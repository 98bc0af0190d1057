// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace ferry::core {

// One computed progress update
struct ProgressSample {
    std::uint64_t current{0};
    std::uint64_t total{0};
    double percent{0.0};
    std::uint64_t speed_bps{0};     // Average since start
    std::uint64_t eta_seconds{0};   // 0 when speed is unknown
};

using ProgressSink = std::function<void(const ProgressSample&)>;

// Byte-progress callback handed to transfers: (current, total)
using ProgressFn = std::function<void(std::uint64_t, std::uint64_t)>;

// Compute a sample if one is due: rate limited by `min_interval`,
// always due when current == total.
[[nodiscard]] std::optional<ProgressSample> compute_progress(
    std::uint64_t current,
    std::uint64_t total,
    std::chrono::steady_clock::time_point started_at,
    std::optional<std::chrono::steady_clock::time_point> last_emit_at,
    std::chrono::steady_clock::time_point now,
    std::chrono::milliseconds min_interval) noexcept;

// Rate-limited reporter for a single transfer. Sink failures are logged
// and dropped; they never abort the transfer.
class ProgressReporter {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressReporter(ProgressSink sink,
                              std::chrono::milliseconds min_interval = PROGRESS_INTERVAL,
                              std::function<Clock::time_point()> clock = Clock::now);

    // Returns true if the sink was invoked
    bool report(std::uint64_t current, std::uint64_t total);

    // Adapter usable as a ProgressFn
    [[nodiscard]] ProgressFn as_callback();

    [[nodiscard]] std::uint32_t emitted() const noexcept { return emitted_; }

private:
    ProgressSink sink_;
    std::chrono::milliseconds min_interval_;
    std::function<Clock::time_point()> clock_;
    Clock::time_point started_at_;
    std::optional<Clock::time_point> last_emit_at_;
    std::uint32_t emitted_{0};
};

[[nodiscard]] std::string human_bytes(std::uint64_t bytes);
[[nodiscard]] std::string human_speed(std::uint64_t bps);
[[nodiscard]] std::string human_time(std::uint64_t seconds);

} // namespace ferry::core
