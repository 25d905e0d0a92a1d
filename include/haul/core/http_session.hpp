// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/core/error.hpp>
#include <haul/core/transport.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace haul::core {

// Transport on libcurl's easy interface; one handle per fetch.
class HttpSession : public Transport {
public:
    struct Options {
        std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
        std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
        std::string user_agent;
        bool verify_tls{true};
    };

    HttpSession();
    explicit HttpSession(Options options);

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::error_code fetch(const RangeRequest& request, ResponseSink& sink) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // HTTP status to TaskErrc; empty for < 400
    [[nodiscard]] static std::error_code map_status(long http_code) noexcept;

    // "bytes 100-199/1000" -> 1000; nullopt for "*" or malformed
    [[nodiscard]] static std::optional<std::uint64_t> parse_content_range_total(std::string_view value) noexcept;

private:
    Options options_;
};

} // namespace haul::core
