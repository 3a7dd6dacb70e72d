// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace spool {

constexpr struct Version {
    std::uint32_t major = 0;
    std::uint32_t minor = 2;
    std::uint32_t patch = 0;

    constexpr auto operator<=>(const Version&) const = default;

    [[nodiscard]] std::string to_string() const {
        return std::format("{}.{}.{}", major, minor, patch);
    }
} version;

// Version written into every metadata record
constexpr std::uint32_t METADATA_FORMAT_VERSION = 2;

} // namespace spool
