// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/config.hpp>
#include <haul/core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace haul::core {

namespace {

template<typename T>
void read_value(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

void read_millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = std::chrono::milliseconds(j[key].get<std::int64_t>());
    }
}

} // namespace

//=============================================================================
// SchedulerConfig
//=============================================================================

std::chrono::milliseconds SchedulerConfig::retry_delay(std::uint32_t attempt) const noexcept {
    if (attempt == 0) attempt = 1;
    auto delay = retry_base_delay;
    for (std::uint32_t i = 1; i < attempt && delay < retry_max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, retry_max_delay);
}

std::error_code SchedulerConfig::validate() const noexcept {
    if (max_concurrent == 0) return make_error_code(TaskErrc::invalid_config);
    if (chunk_size == 0) return make_error_code(TaskErrc::invalid_config);
    if (retry_base_delay.count() < 0 || retry_max_delay < retry_base_delay) {
        return make_error_code(TaskErrc::invalid_config);
    }
    if (progress_interval.count() <= 0 || checkpoint_interval.count() <= 0) {
        return make_error_code(TaskErrc::invalid_config);
    }
    if (speed_window.count() <= 0) return make_error_code(TaskErrc::invalid_config);
    if (speed_smoothing <= 0.0 || speed_smoothing > 1.0) {
        return make_error_code(TaskErrc::invalid_config);
    }
    return {};
}

//=============================================================================
// Loading
//=============================================================================

std::expected<SchedulerConfig, std::error_code> parse_config(std::string_view json) noexcept {
    SchedulerConfig config;
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(TaskErrc::invalid_config));
        }

        read_value(j, "max_concurrent", config.max_concurrent);
        read_value(j, "max_retries", config.max_retries);
        read_millis(j, "retry_base_delay_ms", config.retry_base_delay);
        read_millis(j, "retry_max_delay_ms", config.retry_max_delay);
        read_value(j, "chunk_size", config.chunk_size);
        read_value(j, "checkpoint_bytes", config.checkpoint_bytes);
        read_millis(j, "checkpoint_interval_ms", config.checkpoint_interval);
        read_millis(j, "progress_interval_ms", config.progress_interval);
        read_millis(j, "speed_window_ms", config.speed_window);
        read_value(j, "speed_smoothing", config.speed_smoothing);
        read_value(j, "connect_timeout_sec", config.connect_timeout_sec);
        read_value(j, "stall_timeout_sec", config.stall_timeout_sec);
        read_value(j, "log_level", config.log_level);

        std::string dir;
        read_value(j, "download_dir", dir);
        if (!dir.empty()) config.download_dir = dir;

        std::string log_file;
        read_value(j, "log_file", log_file);
        if (!log_file.empty()) config.log_file = log_file;
    } catch (const nlohmann::json::exception& e) {
        HAUL_LOG_WARN("config: {}", e.what());
        return std::unexpected(make_error_code(TaskErrc::invalid_config));
    }

    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }
    return config;
}

std::expected<SchedulerConfig, std::error_code>
load_config(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(TaskErrc::invalid_config));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return parse_config(ss.str());
    } catch (const std::exception& e) {
        HAUL_LOG_WARN("config {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(TaskErrc::invalid_config));
    }
}

} // namespace haul::core
