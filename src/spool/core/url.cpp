// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace spool::core {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    // Parse scheme
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(CacheErrc::invalid_url));
    }
    url.scheme_ = to_lower(url_str.substr(0, scheme_end));

    auto rest_start = scheme_end + 3; // Skip "://"

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }

    // host_end is at the first of: /, ?, #, or end
    auto host_end = std::min({path_start, query_start, fragment_start, url_str.length()});

    auto colon_pos = url_str.find(':', rest_start);
    auto at_pos = url_str.find('@', rest_start);
    auto bracket_start = url_str.find('[', rest_start);
    std::size_t authority_start = rest_start;

    if (at_pos != std::string_view::npos && at_pos < host_end) {
        // Skip userinfo portion
        authority_start = at_pos + 1;
        colon_pos = url_str.find(':', authority_start);
    }

    // IPv6 literal [::1]:port
    if (bracket_start != std::string_view::npos && bracket_start < host_end) {
        auto bracket_end = url_str.find(']', bracket_start);
        if (bracket_end != std::string_view::npos && bracket_end < host_end) {
            url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
            auto ipv6_colon = url_str.find(':', bracket_end);
            if (ipv6_colon != std::string_view::npos && ipv6_colon < host_end) {
                url.port_ = std::string(url_str.substr(ipv6_colon + 1, host_end - ipv6_colon - 1));
            }
        } else {
            url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
        }
    } else if (colon_pos != std::string_view::npos && colon_pos > authority_start && colon_pos < host_end) {
        url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
        url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
    } else {
        url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
    }

    if (path_start < url_str.length() && path_start < std::min(query_start, fragment_start)) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(CacheErrc::invalid_url));
    }

    if (!url.port_.empty() &&
        !std::all_of(url.port_.begin(), url.port_.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return std::unexpected(make_error_code(CacheErrc::invalid_url));
    }

    url.str_ = std::string(url_str);
    return url;
}

std::string Url::canonical() const {
    std::string result = scheme_;
    result += "://";
    result += to_lower(host_);
    if (!port_.empty() && port_ != std::to_string(default_port())) {
        result += ":";
        result += port_;
    }
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    if (scheme_ == "ftp") return 21;
    return 0;
}

} // namespace spool::core
