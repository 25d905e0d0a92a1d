// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/task.hpp>
#include <algorithm>
#include <random>

namespace haul::core {

double Task::fraction() const noexcept {
    if (!total_bytes) return 0.0;
    if (*total_bytes == 0) return status == TaskStatus::completed ? 1.0 : 0.0;
    auto done = std::min(partial_bytes, *total_bytes);
    return static_cast<double>(done) / static_cast<double>(*total_bytes);
}

//=============================================================================
// Enum conversions
//=============================================================================

std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::queued:      return "queued";
        case TaskStatus::downloading: return "downloading";
        case TaskStatus::paused:      return "paused";
        case TaskStatus::completed:   return "completed";
        case TaskStatus::error:       return "error";
        case TaskStatus::cancelled:   return "cancelled";
    }
    return "unknown";
}

std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::low:    return "low";
        case Priority::normal: return "normal";
        case Priority::high:   return "high";
    }
    return "unknown";
}

std::string_view to_string(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case DigestAlgorithm::md5:    return "md5";
        case DigestAlgorithm::sha1:   return "sha1";
        case DigestAlgorithm::sha256: return "sha256";
    }
    return "unknown";
}

std::optional<TaskStatus> parse_status(std::string_view text) noexcept {
    if (text == "queued") return TaskStatus::queued;
    if (text == "downloading") return TaskStatus::downloading;
    if (text == "paused") return TaskStatus::paused;
    if (text == "completed") return TaskStatus::completed;
    if (text == "error") return TaskStatus::error;
    if (text == "cancelled") return TaskStatus::cancelled;
    return std::nullopt;
}

std::optional<Priority> parse_priority(std::string_view text) noexcept {
    if (text == "low") return Priority::low;
    if (text == "normal") return Priority::normal;
    if (text == "high") return Priority::high;
    return std::nullopt;
}

std::optional<DigestAlgorithm> parse_digest_algorithm(std::string_view text) noexcept {
    if (text == "md5") return DigestAlgorithm::md5;
    if (text == "sha1") return DigestAlgorithm::sha1;
    if (text == "sha256") return DigestAlgorithm::sha256;
    return std::nullopt;
}

//=============================================================================
// State machine
//=============================================================================

bool can_transition(TaskStatus from, TaskStatus to) noexcept {
    switch (from) {
        case TaskStatus::queued:
            return to == TaskStatus::downloading
                || to == TaskStatus::paused
                || to == TaskStatus::cancelled;
        case TaskStatus::downloading:
            // -> queued covers delayed retry, shutdown and stale recovery
            return to == TaskStatus::completed
                || to == TaskStatus::error
                || to == TaskStatus::paused
                || to == TaskStatus::cancelled
                || to == TaskStatus::queued;
        case TaskStatus::paused:
            return to == TaskStatus::queued || to == TaskStatus::cancelled;
        case TaskStatus::error:
            return to == TaskStatus::queued || to == TaskStatus::cancelled;
        case TaskStatus::completed:
        case TaskStatus::cancelled:
            return false;
    }
    return false;
}

//=============================================================================
// Helpers
//=============================================================================

std::string generate_task_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    constexpr char HEX[] = "0123456789abcdef";

    auto value = rng();
    std::string id(16, '0');
    for (std::size_t i = 0; i < id.size(); ++i) {
        id[i] = HEX[(value >> (i * 4)) & 0xF];
    }
    return id;
}

std::int64_t to_epoch_ms(TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_ms(std::int64_t ms) noexcept {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace haul::core
