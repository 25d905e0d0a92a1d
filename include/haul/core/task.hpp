// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace haul::core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class TaskStatus : std::uint8_t {
    queued,
    downloading,
    paused,
    completed,
    error,
    cancelled,
};

// Admission-order hint; never preempts a running transfer
enum class Priority : std::uint8_t {
    low,
    normal,
    high,
};

enum class DigestAlgorithm : std::uint8_t {
    md5,
    sha1,
    sha256,
};

struct Digest {
    DigestAlgorithm algorithm{DigestAlgorithm::sha256};
    std::string hex;

    bool operator==(const Digest&) const = default;
};

// One file's download job and its persisted state
struct Task {
    std::string id;
    std::string source_id;
    std::string file_name;
    std::string url;
    std::string save_path;

    std::optional<std::uint64_t> total_bytes;  // empty until the server reports a size
    std::optional<std::uint64_t> expected_bytes;  // caller-supplied; any other remote size is an integrity failure
    std::uint64_t partial_bytes{0};

    TaskStatus status{TaskStatus::queued};
    Priority priority{Priority::normal};
    std::uint32_t retry_count{0};
    std::optional<std::string> error_message;

    // Resume validators sent back as If-Range
    std::string etag;
    std::string last_modified;

    std::optional<Digest> digest;

    std::optional<TimePoint> scheduled_at;  // not admitted before this
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    TimePoint created_at{};
    TimePoint updated_at{};

    // 0.0 - 1.0; 0 while the size is unknown
    [[nodiscard]] double fraction() const noexcept;

    [[nodiscard]] bool is_terminal() const noexcept {
        return status == TaskStatus::completed || status == TaskStatus::cancelled;
    }

    bool operator==(const Task&) const = default;
};

[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;
[[nodiscard]] std::string_view to_string(Priority priority) noexcept;
[[nodiscard]] std::string_view to_string(DigestAlgorithm algorithm) noexcept;

[[nodiscard]] std::optional<TaskStatus> parse_status(std::string_view text) noexcept;
[[nodiscard]] std::optional<Priority> parse_priority(std::string_view text) noexcept;
[[nodiscard]] std::optional<DigestAlgorithm> parse_digest_algorithm(std::string_view text) noexcept;

// Whether the state machine allows `from -> to`
[[nodiscard]] bool can_transition(TaskStatus from, TaskStatus to) noexcept;

// 16 hex chars, random
[[nodiscard]] std::string generate_task_id();

// Millisecond timestamps as stored on disk
[[nodiscard]] std::int64_t to_epoch_ms(TimePoint tp) noexcept;
[[nodiscard]] TimePoint from_epoch_ms(std::int64_t ms) noexcept;

} // namespace haul::core
