// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/byte_format.hpp>
#include <format>

namespace spool::core {

std::string format_bytes(std::int64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;
    constexpr double GB = 1024.0 * MB;

    const auto value = static_cast<double>(bytes);
    if (value >= GB) {
        return std::format("{:.2f} GB", value / GB);
    }
    if (value >= MB) {
        return std::format("{:.2f} MB", value / MB);
    }
    if (value >= KB) {
        return std::format("{:.2f} KB", value / KB);
    }
    return std::format("{} bytes", bytes);
}

} // namespace spool::core
