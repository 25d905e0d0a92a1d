// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace haul::core {

struct Progress {
    double fraction{0.0};                  // 0 while size unknown
    double speed_bps{0.0};                 // smoothed
    std::optional<double> eta_seconds;     // undefined when speed is 0 or size unknown
    std::uint64_t bytes_done{0};
    std::optional<std::uint64_t> total_bytes;

    bool operator==(const Progress&) const = default;
};

using ProgressSnapshot = std::map<std::string, Progress, std::less<>>;

// Smoothed throughput and ETA per active task.
//
// Workers call record() with byte deltas; the scheduler calls snapshot() on
// a fixed cadence. Each snapshot folds the rate over the trailing sample
// window into an exponential moving average, so the reported speed reacts
// to stalls without jumping on every chunk.
class ProgressTracker {
public:
    using SteadyClock = std::chrono::steady_clock;
    using SteadyTime = SteadyClock::time_point;

    explicit ProgressTracker(std::chrono::milliseconds window = SPEED_WINDOW,
                             double smoothing = SPEED_SMOOTHING) noexcept;

    void begin(std::string_view id, std::uint64_t bytes_done,
               std::optional<std::uint64_t> total, SteadyTime now = SteadyClock::now());

    void record(std::string_view id, std::uint64_t delta, SteadyTime now = SteadyClock::now());

    void set_total(std::string_view id, std::optional<std::uint64_t> total) noexcept;

    // Restart accounting at `bytes_done` (server ignored the range)
    void rebase(std::string_view id, std::uint64_t bytes_done, SteadyTime now = SteadyClock::now());

    void end(std::string_view id) noexcept;

    [[nodiscard]] bool tracking(std::string_view id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    // Advances the moving averages; call at the publishing cadence
    [[nodiscard]] ProgressSnapshot snapshot(SteadyTime now = SteadyClock::now());

    // Last computed values without advancing the averages
    [[nodiscard]] ProgressSnapshot peek() const;

private:
    struct Sample {
        SteadyTime at;
        std::uint64_t bytes;
    };

    struct Entry {
        std::uint64_t bytes_done{0};
        std::optional<std::uint64_t> total;
        std::deque<Sample> samples;
        SteadyTime started;
        double speed{0.0};
        bool primed{false};
    };

    void trim(Entry& entry, SteadyTime now) const noexcept;
    [[nodiscard]] static Progress make_progress(const Entry& entry) noexcept;

    std::chrono::milliseconds window_;
    double smoothing_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry, std::less<>> entries_;
};

} // namespace haul::core
