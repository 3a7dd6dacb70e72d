// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/http_session.hpp>
#include <spool/core/config.hpp>
#include <spool/core/log.hpp>
#include <curl/curl.h>
#include <cctype>
#include <charconv>
#include <format>
#include <optional>
#include <string_view>

namespace spool::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new header block (redirects)
    if (header.starts_with("HTTP/")) {
        headers->clear();
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

    (*headers)[lower_name] = std::string(value);
    return total;
}

std::error_code status_error(long http_code) {
    if (http_code < 400) return {};
    if (http_code == 404) return make_error_code(CacheErrc::not_found);
    if (http_code == 416) return make_error_code(CacheErrc::invalid_range);
    if (http_code >= 500) return make_error_code(CacheErrc::server_error);
    return make_error_code(CacheErrc::network_error);
}

struct TransferState {
    CURL* curl{nullptr};
    const BodyCallback* on_body{nullptr};
    const CancelCheck* cancelled{nullptr};
    bool expect_partial{false};
    bool status_checked{false};
    std::error_code error;
};

// The body must never reach the cache unless the status says it is the
// requested range
std::error_code check_status(TransferState& state) {
    state.status_checked = true;

    long http_code = 0;
    curl_easy_getinfo(state.curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (auto ec = status_error(http_code)) return ec;

    // A server that ignores Range replies 200 with the body from byte 0
    if (state.expect_partial && http_code != 206) {
        return make_error_code(CacheErrc::invalid_range);
    }
    return {};
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* state = static_cast<TransferState*>(userdata);
    std::size_t bytes = size * nmemb;

    if (!state->status_checked) {
        if (auto ec = check_status(*state)) {
            state->error = ec;
            return 0;
        }
    }

    if (!state->on_body || !*state->on_body) return bytes;

    try {
        auto ec = (*state->on_body)(std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), bytes));
        if (ec) {
            // Returning short aborts the transfer
            state->error = ec;
            return 0;
        }
    } catch (const std::exception& e) {
        logger()->error("http: body handler threw: {}", e.what());
        state->error = make_error_code(CacheErrc::persistence_failed);
        return 0;
    }
    return bytes;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* state = static_cast<TransferState*>(userdata);
    if (state->cancelled && *state->cancelled && (*state->cancelled)()) {
        state->error = make_error_code(CacheErrc::cancelled);
        return 1;
    }
    return 0;
}

void set_common_options(CURL* curl, const std::string& url) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
}

std::optional<std::int64_t> parse_int(std::string_view s) {
    std::int64_t value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || end != s.data() + s.size() || value < 0) return std::nullopt;
    return value;
}

void fill_from_headers(HttpResponse& response) {
    if (auto it = response.headers.find("content-type"); it != response.headers.end()) {
        response.content_type = it->second;
    }
    if (auto it = response.headers.find("accept-ranges"); it != response.headers.end()) {
        response.accepts_ranges = it->second.find("bytes") != std::string::npos;
    }

    // A ranged response names the full size in Content-Range
    if (auto it = response.headers.find("content-range"); it != response.headers.end()) {
        response.accepts_ranges = true;
        if (auto total = parse_content_range_total(it->second)) {
            response.content_length = *total;
            return;
        }
    }
    if (auto it = response.headers.find("content-length"); it != response.headers.end()) {
        response.content_length = parse_int(it->second).value_or(0);
    }
}

} // namespace

std::optional<std::int64_t> parse_content_range_total(std::string_view value) noexcept {
    auto slash = value.rfind('/');
    if (slash == std::string_view::npos) return std::nullopt;
    return parse_int(value.substr(slash + 1));
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(CacheErrc::network_error));
    }

    HttpResponse response;
    set_common_options(curl.ptr, url);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        logger()->warn("http: HEAD {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(make_error_code(CacheErrc::network_error));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);
    if (auto ec = status_error(http_code)) {
        return std::unexpected(ec);
    }

    fill_from_headers(response);
    return response;
}

std::expected<HttpResponse, std::error_code>
HttpSession::fetch(const std::string& url,
                   std::int64_t offset,
                   std::int64_t length,
                   const BodyCallback& on_body,
                   const CancelCheck& cancelled) noexcept {
    if (offset < 0 || length < 0) {
        return std::unexpected(make_error_code(CacheErrc::invalid_range));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(CacheErrc::network_error));
    }

    HttpResponse response;
    TransferState state;
    state.curl = curl.ptr;
    state.on_body = &on_body;
    state.cancelled = &cancelled;

    set_common_options(curl.ptr, url);

    std::string range;
    if (length > 0) {
        range = std::format("{}-{}", offset, offset + length - 1);
    } else if (offset > 0) {
        range = std::format("{}-", offset);
    }
    if (!range.empty()) {
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
        // From byte 0 a plain 200 still lines up with the request
        state.expect_partial = offset > 0;
    }

    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(RECEIVE_BUFFER_SIZE));

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    if (state.error) {
        if (state.error == make_error_code(CacheErrc::invalid_range)) {
            logger()->warn("http: {} answered {} to range {}", url, http_code, range);
        }
        return std::unexpected(state.error);
    }
    if (result != CURLE_OK) {
        logger()->warn("http: GET {} [{}] failed: {}", url, range, curl_easy_strerror(result));
        return std::unexpected(make_error_code(CacheErrc::network_error));
    }
    if (auto ec = status_error(http_code)) {
        return std::unexpected(ec);
    }

    fill_from_headers(response);
    return response;
}

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace spool::core
