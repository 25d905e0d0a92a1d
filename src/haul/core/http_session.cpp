// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/http_session.hpp>
#include <haul/core/log.hpp>
#include <haul/version.hpp>
#include <curl/curl.h>
#include <cctype>
#include <charconv>
#include <string>

namespace haul::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& line) {
        if (auto* next = curl_slist_append(ptr, line.c_str())) {
            ptr = next;
        }
    }
};

struct TransferState {
    CURL* curl{nullptr};
    ResponseSink* sink{nullptr};
    std::map<std::string, std::string> headers;
    bool response_delivered{false};
    bool aborted_by_sink{false};
    bool unsatisfiable_reported{false};
    long rejected_status{0};
};

std::optional<std::uint64_t> parse_u64(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    std::uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string header_value(const TransferState& st, const char* name) {
    auto it = st.headers.find(name);
    return it == st.headers.end() ? std::string{} : it->second;
}

// Header callback; a status line starts a new header block (redirects)
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* st = static_cast<TransferState*>(userdata);
    if (!st) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        st->headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    st->headers[lower_name] = std::string(value);
    return total;
}

// 416 carries the remote size as "bytes */T"
void report_unsatisfiable(TransferState& st) {
    if (st.unsatisfiable_reported) return;
    st.unsatisfiable_reported = true;
    st.sink->on_range_not_satisfiable(
        HttpSession::parse_content_range_total(header_value(st, "content-range")));
}

// Hand the final response's headers to the sink. False stops the transfer.
bool deliver_response(TransferState& st) {
    long http_code = 0;
    curl_easy_getinfo(st.curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 400) {
        st.rejected_status = http_code;
        if (http_code == 416) {
            report_unsatisfiable(st);
        }
        return false;
    }

    ResponseInfo info;
    info.status_code = static_cast<std::int32_t>(http_code);
    info.partial = http_code == 206;
    info.content_length = parse_u64(header_value(st, "content-length"));
    info.etag = header_value(st, "etag");
    info.last_modified = header_value(st, "last-modified");
    if (info.partial) {
        info.entity_size = HttpSession::parse_content_range_total(header_value(st, "content-range"));
    } else {
        info.entity_size = info.content_length;
    }

    st.response_delivered = true;
    if (!st.sink->on_response(info)) {
        st.aborted_by_sink = true;
        return false;
    }
    return true;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* st = static_cast<TransferState*>(userdata);
    std::size_t bytes = size * nmemb;

    try {
        if (!st->response_delivered && !deliver_response(*st)) {
            return 0;
        }
        if (!st->sink->on_data(reinterpret_cast<const std::byte*>(ptr), bytes)) {
            st->aborted_by_sink = true;
            return 0;
        }
    } catch (const std::exception& e) {
        HAUL_LOG_ERROR("http: sink threw: {}", e.what());
        st->aborted_by_sink = true;
        return 0;
    }
    return bytes;
}

// libcurl progress callback - lets the sink abort an idle transfer
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* st = static_cast<TransferState*>(userdata);
    try {
        if (!st->sink->keep_going()) {
            st->aborted_by_sink = true;
            return 1;
        }
    } catch (const std::exception& e) {
        HAUL_LOG_ERROR("http: sink threw: {}", e.what());
        st->aborted_by_sink = true;
        return 1;
    }
    return 0;
}

std::error_code map_curl_error(CURLcode result) noexcept {
    switch (result) {
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(TaskErrc::timeout);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(TaskErrc::invalid_url);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(TaskErrc::http_error);
        default:
            // resolve/connect/recv/send/partial/TLS handshake failures
            return make_error_code(TaskErrc::network_error);
    }
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession()
    : HttpSession(Options{}) {}

HttpSession::HttpSession(Options options)
    : options_(std::move(options)) {
    if (options_.user_agent.empty()) {
        options_.user_agent = std::string(USER_AGENT);
    }
}

std::error_code HttpSession::fetch(const RangeRequest& request, ResponseSink& sink) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return make_error_code(TaskErrc::network_error);
    }

    TransferState st;
    st.curl = curl.ptr;
    st.sink = &sink;

    HeaderList headers;
    std::string range;
    try {
        if (request.offset > 0) {
            range = std::to_string(request.offset) + "-";
            if (!request.if_range.empty()) {
                headers.append("If-Range: " + request.if_range);
            }
        }
        if (request.reduced_priority) {
            headers.append("X-Accept-Reduced-Priority: 1");
        }
    } catch (const std::exception&) {
        return make_error_code(TaskErrc::network_error);
    }

    curl_easy_setopt(curl.ptr, CURLOPT_URL, request.url.c_str());
    if (!range.empty()) {
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }
    if (headers.ptr) {
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.ptr);
    }
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, options_.user_agent.c_str());

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &st);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &st);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &st);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    // Timeouts
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout_sec));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout_sec));

    // SSL options
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (st.aborted_by_sink) {
        return make_error_code(TaskErrc::cancelled);
    }
    if (st.rejected_status != 0) {
        HAUL_LOG_DEBUG("http: {} -> HTTP {}", request.url, st.rejected_status);
        return map_status(st.rejected_status);
    }
    if (result != CURLE_OK) {
        HAUL_LOG_DEBUG("http: {} -> curl error {}: {}", request.url,
                       static_cast<int>(result), curl_easy_strerror(result));
        return map_curl_error(result);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (auto ec = map_status(http_code)) {
        if (http_code == 416) {
            try {
                report_unsatisfiable(st);
            } catch (const std::exception& e) {
                HAUL_LOG_ERROR("http: sink threw: {}", e.what());
            }
        }
        return ec;
    }

    // Empty body: the write callback never ran
    if (!st.response_delivered) {
        try {
            if (!deliver_response(st)) {
                return st.aborted_by_sink ? make_error_code(TaskErrc::cancelled) : map_status(st.rejected_status);
            }
        } catch (const std::exception& e) {
            HAUL_LOG_ERROR("http: sink threw: {}", e.what());
            return make_error_code(TaskErrc::cancelled);
        }
    }
    return {};
}

std::error_code HttpSession::map_status(long http_code) noexcept {
    if (http_code < 400) return {};
    if (http_code == 408) return make_error_code(TaskErrc::timeout);
    if (http_code == 429) return make_error_code(TaskErrc::rate_limited);
    if (http_code >= 500) return make_error_code(TaskErrc::server_error);
    if (http_code == 404 || http_code == 410) return make_error_code(TaskErrc::remote_not_found);
    if (http_code == 416) return make_error_code(TaskErrc::range_not_satisfiable);
    return make_error_code(TaskErrc::http_error);
}

std::optional<std::uint64_t> HttpSession::parse_content_range_total(std::string_view value) noexcept {
    auto slash = value.rfind('/');
    if (slash == std::string_view::npos) return std::nullopt;
    auto total = value.substr(slash + 1);
    if (total == "*") return std::nullopt;
    return parse_u64(total);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace haul::core
