// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace spool::core {

// Response status and the headers the cache cares about
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;
    std::int64_t content_length{0};     // whole resource, from Content-Range when ranged
    std::string content_type;
    bool accepts_ranges{false};
};

// Receives body bytes as they arrive; an error aborts the transfer
using BodyCallback = std::function<std::error_code(std::span<const std::byte>)>;

// Polled during the transfer; true aborts with `cancelled`
using CancelCheck = std::function<bool()>;

class HttpSession {
public:
    HttpSession() = default;

    // Content length, type and range support of the resource
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept;

    // Stream [offset, offset + length) into `on_body`. A length of 0 reads
    // to the end of the resource.
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    fetch(const std::string& url,
          std::int64_t offset,
          std::int64_t length,
          const BodyCallback& on_body,
          const CancelCheck& cancelled = {}) noexcept;

    // Once per process, before any request
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

// Total size from "bytes 0-99/1234"; nullopt for "*" or malformed values
[[nodiscard]] std::optional<std::int64_t> parse_content_range_total(std::string_view value) noexcept;

} // namespace spool::core
