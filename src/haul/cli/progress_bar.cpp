// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace haul::cli {

namespace {

// Erase the current terminal line
constexpr std::string_view CLEAR_LINE = "\r\x1b[2K";

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::string_view label, int width)
    : label_(label)
    , width_(width) {}

std::string ProgressBar::render(const core::Progress& progress) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    const double percent = std::clamp(progress.fraction * 100.0, 0.0, 100.0);

    if (progress.total_bytes) {
        line += render_bar(percent);

        // Format percentage with padding
        const int pct_int = static_cast<int>(percent);
        line += " ";
        if (pct_int < 100) line += " ";
        if (pct_int < 10) line += " ";
        line += std::to_string(pct_int) + "%";

        line += " (";
        line += format_bytes(progress.bytes_done);
        line += "/";
        line += format_bytes(*progress.total_bytes);
        line += ")";
    } else {
        // Unknown size: bytes so far only
        line += format_bytes(progress.bytes_done);
    }

    if (progress.speed_bps > 0.0) {
        line += " @ ";
        line += format_speed(static_cast<std::uint64_t>(progress.speed_bps));
    }

    if (progress.eta_seconds) {
        line += " ETA: ";
        line += format_time(static_cast<std::uint64_t>(std::ceil(*progress.eta_seconds)));
    }
    return line;
}

std::string ProgressBar::render_bar(double percent) const {
    const int filled = static_cast<int>(std::round(width_ * percent / 100.0));
    const int empty = width_ - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (empty > 0) {
        bar += '>';
        bar.append(static_cast<std::size_t>(empty - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bps >= GB) {
        return fixed(static_cast<double>(bps) / GB, 1) + " GB/s";
    } else if (bps >= MB) {
        return fixed(static_cast<double>(bps) / MB, 1) + " MB/s";
    } else if (bps >= KB) {
        return fixed(static_cast<double>(bps) / KB, 1) + " KB/s";
    }
    return std::to_string(bps) + " B/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) {
        return fixed(static_cast<double>(bytes) / TB, 2) + " TB";
    } else if (bytes >= GB) {
        return fixed(static_cast<double>(bytes) / GB, 2) + " GB";
    } else if (bytes >= MB) {
        return fixed(static_cast<double>(bytes) / MB, 1) + " MB";
    } else if (bytes >= KB) {
        return fixed(static_cast<double>(bytes) / KB, 0) + " KB";
    }
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    const std::uint64_t hours = seconds / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m";
        return ss.str();
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

//=============================================================================
// ProgressBoard
//=============================================================================

void ProgressBoard::label(const std::string& id, std::string_view label) {
    std::lock_guard lock(mutex_);
    labels_.insert_or_assign(id, std::string(label));
}

void ProgressBoard::draw(const core::ProgressSnapshot& snapshot) {
    std::lock_guard lock(mutex_);

    std::string out;
    // Back to the first line of the previous frame
    for (std::size_t i = 1; i < lines_; ++i) {
        out += "\x1b[1A";
    }

    std::size_t drawn = 0;
    for (const auto& [id, progress] : snapshot) {
        auto it = labels_.find(id);
        ProgressBar bar(it != labels_.end() ? std::string_view(it->second) : std::string_view(id));
        if (drawn > 0) out += "\n";
        out += CLEAR_LINE;
        out += bar.render(progress);
        ++drawn;
    }

    // Blank out lines left over from a taller frame
    for (std::size_t i = drawn; i < lines_; ++i) {
        if (i > 0) out += "\n";
        out += CLEAR_LINE;
    }
    for (std::size_t i = std::max(drawn, std::size_t{1}); i < lines_; ++i) {
        out += "\x1b[1A";
    }

    lines_ = drawn;
    std::cout << out << std::flush;
}

void ProgressBoard::clear() {
    std::lock_guard lock(mutex_);
    std::cout << erase_locked() << std::flush;
}

void ProgressBoard::message(std::string_view line) {
    std::lock_guard lock(mutex_);
    std::cout << erase_locked() << line << std::endl;
}

std::string ProgressBoard::erase_locked() {
    std::string out;
    for (std::size_t i = 1; i < lines_; ++i) {
        out += "\x1b[1A";
    }
    for (std::size_t i = 0; i < lines_; ++i) {
        if (i > 0) out += "\n";
        out += CLEAR_LINE;
    }
    for (std::size_t i = 1; i < lines_; ++i) {
        out += "\x1b[1A";
    }
    lines_ = 0;
    return out;
}

} // namespace haul::cli
