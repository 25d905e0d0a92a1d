// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>
#include <string_view>

namespace haul::core {

enum class TaskErrc {
    success = 0,
    network_error,
    timeout,
    server_error,
    rate_limited,
    http_error,
    remote_not_found,
    range_not_satisfiable,
    size_mismatch,
    digest_mismatch,
    unsupported_digest,
    storage_error,
    task_not_found,
    conflict,
    invalid_transition,
    invalid_url,
    invalid_config,
    cancelled,
};

// Coarse failure taxonomy used by the scheduler's retry policy
enum class ErrorKind {
    none,
    transient_network,
    integrity,
    storage,
    not_found,
    conflict,
    permanent,
    cancelled,
};

namespace detail {

struct TaskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "haul::task";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<TaskErrc>(ev)) {
            case TaskErrc::success:               return "Success";
            case TaskErrc::network_error:         return "Network error";
            case TaskErrc::timeout:               return "Operation timed out";
            case TaskErrc::server_error:          return "Server error (5xx)";
            case TaskErrc::rate_limited:          return "Rate limited by server";
            case TaskErrc::http_error:            return "HTTP request rejected";
            case TaskErrc::remote_not_found:      return "Remote file not found (404)";
            case TaskErrc::range_not_satisfiable: return "Requested range not satisfiable";
            case TaskErrc::size_mismatch:         return "Downloaded size does not match expected size";
            case TaskErrc::digest_mismatch:       return "Checksum mismatch";
            case TaskErrc::unsupported_digest:    return "Unsupported digest algorithm";
            case TaskErrc::storage_error:         return "Local storage error";
            case TaskErrc::task_not_found:        return "No such task";
            case TaskErrc::conflict:              return "Task changed state concurrently";
            case TaskErrc::invalid_transition:    return "Operation not valid in the task's current state";
            case TaskErrc::invalid_url:           return "Invalid URL";
            case TaskErrc::invalid_config:        return "Invalid configuration";
            case TaskErrc::cancelled:             return "Transfer cancelled";
        }
        return "Unknown error";
    }
};

} // namespace detail

inline const detail::TaskErrcCategory& task_errc_category() noexcept {
    static detail::TaskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TaskErrc e) noexcept {
    return {static_cast<int>(e), task_errc_category()};
}

// Map any error code onto the retry taxonomy. Codes from other categories
// (filesystem, errno) count as storage failures.
[[nodiscard]] ErrorKind classify(std::error_code ec) noexcept;

[[nodiscard]] inline bool is_transient(std::error_code ec) noexcept {
    return classify(ec) == ErrorKind::transient_network;
}

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

} // namespace haul::core

namespace std {

template<>
struct is_error_code_enum<haul::core::TaskErrc> : true_type {};

} // namespace std
