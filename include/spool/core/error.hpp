// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace spool::core {

enum class CacheErrc {
    success = 0,
    invalid_range,
    invalid_threshold,
    invalid_key,
    no_content_info,
    session_closed,
    invariant_violation,
    corrupt_record,
    persistence_failed,
    invalid_url,
    network_error,
    not_found,
    server_error,
    cancelled,
    invalid_config,
};

namespace detail {

struct CacheErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "spool::cache";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<CacheErrc>(ev)) {
            case CacheErrc::success:             return "Success";
            case CacheErrc::invalid_range:       return "Invalid byte range";
            case CacheErrc::invalid_threshold:   return "Flush threshold below minimum";
            case CacheErrc::invalid_key:         return "Invalid resource key";
            case CacheErrc::no_content_info:     return "No content information for resource";
            case CacheErrc::session_closed:      return "Write session already closed";
            case CacheErrc::invariant_violation: return "Write session invariant violated";
            case CacheErrc::corrupt_record:      return "Corrupt metadata record";
            case CacheErrc::persistence_failed:  return "Persistence failed";
            case CacheErrc::invalid_url:         return "Invalid URL";
            case CacheErrc::network_error:       return "Network error";
            case CacheErrc::not_found:           return "Resource not found (404)";
            case CacheErrc::server_error:        return "Server error (5xx)";
            case CacheErrc::cancelled:           return "Operation cancelled";
            case CacheErrc::invalid_config:      return "Invalid configuration";
            default:                             return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::CacheErrcCategory& cache_errc_category() noexcept {
    static detail::CacheErrcCategory category;
    return category;
}

inline std::error_code make_error_code(CacheErrc e) noexcept {
    return {static_cast<int>(e), cache_errc_category()};
}

} // namespace spool::core

namespace std {

template<>
struct is_error_code_enum<spool::core::CacheErrc> : true_type {};

} // namespace std
