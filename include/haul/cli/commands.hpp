// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/task.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace haul::cli {

// CLI result: process exit code, or the error that ended the command
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string command;
    std::vector<std::string> operands;

    // Global options
    std::string store_path;
    std::string config_path;
    std::string download_dir;
    std::uint32_t jobs{0};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};

    // add
    std::string output_file;
    std::string source_id;
    std::optional<core::Priority> priority;
    std::optional<std::uint64_t> size;
    std::optional<core::Digest> digest;
    std::optional<std::int64_t> start_at;  // epoch seconds

    // list / delete / prune
    bool json{false};
    bool with_file{false};
    std::uint32_t days{30};

    // Set when the command line could not be understood
    std::string error;
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Open the store, build a scheduler and dispatch `args.command`
[[nodiscard]] CliResult execute(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace haul::cli
