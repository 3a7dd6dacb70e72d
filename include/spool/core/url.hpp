// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace spool::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    // As given to parse()
    [[nodiscard]] const std::string& str() const noexcept { return str_; }


    // Lower-case host, default port dropped, no fragment
    [[nodiscard]] std::string canonical() const;

    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] std::uint16_t default_port() const noexcept;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

} // namespace spool::core
