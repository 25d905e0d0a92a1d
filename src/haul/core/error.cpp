// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/error.hpp>

namespace haul::core {

ErrorKind classify(std::error_code ec) noexcept {
    if (!ec) return ErrorKind::none;

    if (ec.category() != task_errc_category()) {
        return ErrorKind::storage;
    }

    switch (static_cast<TaskErrc>(ec.value())) {
        case TaskErrc::success:
            return ErrorKind::none;
        case TaskErrc::network_error:
        case TaskErrc::timeout:
        case TaskErrc::server_error:
        case TaskErrc::rate_limited:
            return ErrorKind::transient_network;
        case TaskErrc::size_mismatch:
        case TaskErrc::digest_mismatch:
            return ErrorKind::integrity;
        case TaskErrc::storage_error:
            return ErrorKind::storage;
        case TaskErrc::task_not_found:
            return ErrorKind::not_found;
        case TaskErrc::conflict:
            return ErrorKind::conflict;
        case TaskErrc::cancelled:
            return ErrorKind::cancelled;
        case TaskErrc::http_error:
        case TaskErrc::remote_not_found:
        case TaskErrc::range_not_satisfiable:
        case TaskErrc::unsupported_digest:
        case TaskErrc::invalid_transition:
        case TaskErrc::invalid_url:
        case TaskErrc::invalid_config:
            return ErrorKind::permanent;
    }
    return ErrorKind::permanent;
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::none:              return "none";
        case ErrorKind::transient_network: return "transient";
        case ErrorKind::integrity:         return "integrity";
        case ErrorKind::storage:           return "storage";
        case ErrorKind::not_found:         return "not-found";
        case ErrorKind::conflict:          return "conflict";
        case ErrorKind::permanent:         return "permanent";
        case ErrorKind::cancelled:         return "cancelled";
    }
    return "unknown";
}

} // namespace haul::core
