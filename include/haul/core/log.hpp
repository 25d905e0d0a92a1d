// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string_view>

namespace haul::log {

// Replace the shared "haul" logger with a stderr sink at `level`, plus a
// rotating file sink when `file` is non-empty.
void init(spdlog::level::level_enum level, const std::filesystem::path& file = {});

// Parse "trace".."off"; unknown names fall back to info
[[nodiscard]] spdlog::level::level_enum parse_level(std::string_view name) noexcept;

// Shared logger; created on first use with a warn-level stderr sink.
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

void shutdown() noexcept;

} // namespace haul::log

#define HAUL_LOG_TRACE(...) ::haul::log::get()->trace(__VA_ARGS__)
#define HAUL_LOG_DEBUG(...) ::haul::log::get()->debug(__VA_ARGS__)
#define HAUL_LOG_INFO(...)  ::haul::log::get()->info(__VA_ARGS__)
#define HAUL_LOG_WARN(...)  ::haul::log::get()->warn(__VA_ARGS__)
#define HAUL_LOG_ERROR(...) ::haul::log::get()->error(__VA_ARGS__)
