// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace haul::core {

constexpr std::uint32_t DEFAULT_MAX_CONCURRENT = 3;
constexpr std::uint32_t DEFAULT_MAX_RETRIES = 5;
constexpr std::chrono::milliseconds DEFAULT_RETRY_BASE_DELAY{2000};
constexpr std::chrono::milliseconds DEFAULT_RETRY_MAX_DELAY{64000};

constexpr std::size_t CHUNK_SIZE = 64 * 1024;                       // 64 KB
constexpr std::uint64_t CHECKPOINT_BYTES = 1024 * 1024;            // 1 MB
constexpr std::chrono::milliseconds CHECKPOINT_INTERVAL{2000};

constexpr std::chrono::milliseconds PROGRESS_INTERVAL{250};
constexpr std::chrono::milliseconds SPEED_WINDOW{3000};
constexpr double SPEED_SMOOTHING = 0.3;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::string_view STORE_FILE_NAME = "tasks.json";

struct SchedulerConfig {
    std::uint32_t max_concurrent{DEFAULT_MAX_CONCURRENT};
    std::uint32_t max_retries{DEFAULT_MAX_RETRIES};
    std::chrono::milliseconds retry_base_delay{DEFAULT_RETRY_BASE_DELAY};
    std::chrono::milliseconds retry_max_delay{DEFAULT_RETRY_MAX_DELAY};

    std::size_t chunk_size{CHUNK_SIZE};
    std::uint64_t checkpoint_bytes{CHECKPOINT_BYTES};
    std::chrono::milliseconds checkpoint_interval{CHECKPOINT_INTERVAL};

    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
    std::chrono::milliseconds speed_window{SPEED_WINDOW};
    double speed_smoothing{SPEED_SMOOTHING};

    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};

    // Where tasks without an explicit save path land: <download_dir>/<source>/<file>
    std::filesystem::path download_dir{"downloads"};

    std::string log_level{"warn"};
    std::filesystem::path log_file;

    // Delay before retry attempt `attempt` (1-based): base * 2^(attempt-1), capped
    [[nodiscard]] std::chrono::milliseconds retry_delay(std::uint32_t attempt) const noexcept;

    [[nodiscard]] std::error_code validate() const noexcept;
};

// Read overrides from a JSON object; absent keys keep their defaults.
[[nodiscard]] std::expected<SchedulerConfig, std::error_code>
load_config(const std::filesystem::path& path) noexcept;

[[nodiscard]] std::expected<SchedulerConfig, std::error_code>
parse_config(std::string_view json) noexcept;

} // namespace haul::core
