// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <vector>

namespace haul::log {

namespace {

constexpr std::size_t LOG_FILE_SIZE = 5 * 1024 * 1024;  // 5 MB
constexpr std::size_t LOG_FILE_COUNT = 3;

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_logger(spdlog::level::level_enum level,
                                            const std::filesystem::path& file) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    if (!file.empty()) {
        if (file.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(file.parent_path(), ec);
        }
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file.string(), LOG_FILE_SIZE, LOG_FILE_COUNT);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("haul", sinks.begin(), sinks.end());
    logger->set_level(file.empty() ? level : std::min(level, spdlog::level::debug));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

void init(spdlog::level::level_enum level, const std::filesystem::path& file) {
    auto logger = make_logger(level, file);
    std::lock_guard lock(g_mutex);
    g_logger = std::move(logger);
}

spdlog::level::level_enum parse_level(std::string_view name) noexcept {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard lock(g_mutex);
    if (!g_logger) {
        g_logger = make_logger(spdlog::level::warn, {});
    }
    return g_logger;
}

void shutdown() noexcept {
    std::lock_guard lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
        g_logger.reset();
    }
}

} // namespace haul::log
