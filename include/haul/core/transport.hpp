// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace haul::core {

// GET url from `offset` to the end of the entity
struct RangeRequest {
    std::string url;
    std::uint64_t offset{0};
    std::string if_range;         // ETag or Last-Modified; empty sends no If-Range
    bool reduced_priority{false}; // X-Accept-Reduced-Priority courtesy header
};

struct ResponseInfo {
    std::int32_t status_code{0};
    bool partial{false};                         // 206: body starts at the requested offset
    std::optional<std::uint64_t> content_length; // bytes in this response body
    std::optional<std::uint64_t> entity_size;    // full remote size, from Content-Range or length
    std::string etag;
    std::string last_modified;
};

// Receives one response. Returning false from any callback aborts the
// transfer and fetch() reports TaskErrc::cancelled.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    // Called once, before the first body byte, for 2xx responses only
    virtual bool on_response(const ResponseInfo& info) = 0;

    virtual bool on_data(const std::byte* data, std::size_t size) = 0;

    // Polled while the transfer is idle
    virtual bool keep_going() = 0;

    // A 416 answer, before fetch() returns range_not_satisfiable.
    // `entity_size` is T from "Content-Range: bytes */T" when the server sent it.
    virtual void on_range_not_satisfiable(std::optional<std::uint64_t> entity_size) = 0;
};

// Ranged HTTP GET. Implementations must be callable from several worker
// threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    // Empty on a fully delivered body. HTTP errors map onto TaskErrc:
    // 408/5xx/429 transient, 404 remote_not_found, 416 range_not_satisfiable,
    // other 4xx http_error.
    [[nodiscard]] virtual std::error_code fetch(const RangeRequest& request, ResponseSink& sink) noexcept = 0;
};

} // namespace haul::core
