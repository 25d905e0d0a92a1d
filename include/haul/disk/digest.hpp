// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/task.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>

namespace haul::disk {

// Lowercase hex digest of the whole file
[[nodiscard]] std::expected<std::string, std::error_code>
file_digest(const std::filesystem::path& path, core::DigestAlgorithm algorithm) noexcept;

// Case-insensitive hex comparison
[[nodiscard]] bool digest_equals(std::string_view a, std::string_view b) noexcept;

} // namespace haul::disk
