// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace haul::disk {

enum class DiskErrc {
    success = 0,
    access_denied,
    disk_full,
    invalid_path,
    open_failed,
    write_error,
    read_error,
    truncate_error,
    sync_error,
    handle_invalid,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "haul::disk";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:        return "Success";
            case DiskErrc::access_denied:  return "Access denied";
            case DiskErrc::disk_full:      return "Disk full";
            case DiskErrc::invalid_path:   return "Invalid path";
            case DiskErrc::open_failed:    return "Cannot open file";
            case DiskErrc::write_error:    return "Write error";
            case DiskErrc::read_error:     return "Read error";
            case DiskErrc::truncate_error: return "Cannot truncate file";
            case DiskErrc::sync_error:     return "Cannot flush file to disk";
            case DiskErrc::handle_invalid: return "File is not open";
        }
        return "Unknown error";
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Map an errno value onto DiskErrc, `fallback` for anything unrecognised
[[nodiscard]] std::error_code from_errno(int err, DiskErrc fallback) noexcept;

} // namespace haul::disk

namespace std {

template<>
struct is_error_code_enum<haul::disk::DiskErrc> : true_type {};

} // namespace std
