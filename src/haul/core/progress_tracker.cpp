// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/progress_tracker.hpp>
#include <algorithm>

namespace haul::core {

namespace {

// Below this the average is treated as a stall
constexpr double MIN_SPEED_BPS = 1.0;

} // namespace

ProgressTracker::ProgressTracker(std::chrono::milliseconds window, double smoothing) noexcept
    : window_(window.count() > 0 ? window : SPEED_WINDOW)
    , smoothing_(smoothing > 0.0 && smoothing <= 1.0 ? smoothing : SPEED_SMOOTHING) {}

void ProgressTracker::begin(std::string_view id, std::uint64_t bytes_done,
                            std::optional<std::uint64_t> total, SteadyTime now) {
    Entry entry;
    entry.bytes_done = bytes_done;
    entry.total = total;
    entry.started = now;

    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(std::string(id), std::move(entry));
}

void ProgressTracker::record(std::string_view id, std::uint64_t delta, SteadyTime now) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return;

    auto& entry = it->second;
    entry.bytes_done += delta;
    entry.samples.push_back({now, delta});
    trim(entry, now);
}

void ProgressTracker::set_total(std::string_view id, std::optional<std::uint64_t> total) noexcept {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it != entries_.end()) {
        it->second.total = total;
    }
}

void ProgressTracker::rebase(std::string_view id, std::uint64_t bytes_done, SteadyTime now) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return;

    it->second.bytes_done = bytes_done;
    it->second.samples.clear();
    it->second.started = now;
}

void ProgressTracker::end(std::string_view id) noexcept {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it != entries_.end()) {
        entries_.erase(it);
    }
}

bool ProgressTracker::tracking(std::string_view id) const noexcept {
    std::lock_guard lock(mutex_);
    return entries_.find(id) != entries_.end();
}

std::size_t ProgressTracker::size() const noexcept {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void ProgressTracker::trim(Entry& entry, SteadyTime now) const noexcept {
    const auto cutoff = now - window_;
    while (!entry.samples.empty() && entry.samples.front().at < cutoff) {
        entry.samples.pop_front();
    }
}

Progress ProgressTracker::make_progress(const Entry& entry) noexcept {
    Progress p;
    p.bytes_done = entry.bytes_done;
    p.total_bytes = entry.total;
    p.speed_bps = entry.speed >= MIN_SPEED_BPS ? entry.speed : 0.0;

    if (entry.total) {
        const auto total = *entry.total;
        const auto done = std::min(entry.bytes_done, total);
        p.fraction = total == 0 ? 1.0 : static_cast<double>(done) / static_cast<double>(total);
        if (p.speed_bps > 0.0) {
            p.eta_seconds = static_cast<double>(total - done) / p.speed_bps;
        }
    }
    return p;
}

ProgressSnapshot ProgressTracker::snapshot(SteadyTime now) {
    ProgressSnapshot out;

    std::lock_guard lock(mutex_);
    for (auto& [id, entry] : entries_) {
        trim(entry, now);

        std::uint64_t bytes = 0;
        for (const auto& s : entry.samples) {
            bytes += s.bytes;
        }

        // Rate over the part of the window this task has been running
        const auto window_start = std::max(entry.started, now - window_);
        const auto span = std::chrono::duration<double>(now - window_start).count();
        const double instant = span > 0.0 ? static_cast<double>(bytes) / span : 0.0;

        if (!entry.primed) {
            if (span > 0.0) {
                entry.speed = instant;
                entry.primed = true;
            }
        } else {
            entry.speed = smoothing_ * instant + (1.0 - smoothing_) * entry.speed;
        }

        out.emplace(id, make_progress(entry));
    }
    return out;
}

ProgressSnapshot ProgressTracker::peek() const {
    ProgressSnapshot out;
    std::lock_guard lock(mutex_);
    for (const auto& [id, entry] : entries_) {
        out.emplace(id, make_progress(entry));
    }
    return out;
}

} // namespace haul::core
