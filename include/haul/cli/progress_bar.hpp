// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/progress_tracker.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace haul::cli {

// One status line for one transfer
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {}, int width = 30);

    // "label [=====>     ]  42% (4.2 MB/10.0 MB) @ 1.1 MB/s ETA: 5s"
    [[nodiscard]] std::string render(const core::Progress& progress) const;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] std::string render_bar(double percent) const;

    std::string label_;
    int width_;
};

// Redraws one line per active task in place
class ProgressBoard {
public:
    // Labels shown instead of task ids (file names)
    void label(const std::string& id, std::string_view label);

    void draw(const core::ProgressSnapshot& snapshot);

    // Erase the lines drawn last
    void clear();

    // Print a line above the board; the next draw() starts below it
    void message(std::string_view line);

private:
    [[nodiscard]] std::string erase_locked();

    std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> labels_;
    std::size_t lines_{0};
};

} // namespace haul::cli
