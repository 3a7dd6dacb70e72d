// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace spool::cli {

// Single-line transfer progress on stderr
class ProgressBar {
public:
    explicit ProgressBar(std::int64_t total, std::string_view label = {});

    // `current` counts cached plus received bytes
    void update(std::int64_t current) noexcept;

    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::int64_t total() const noexcept { return total_; }
    void total(std::int64_t t) noexcept { total_ = t; }

    [[nodiscard]] static std::string format_speed(double bytes_per_sec);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    void draw(std::int64_t current) noexcept;

    std::int64_t total_{0};
    std::int64_t first_{-1};
    int last_percent_{-1};
    std::string label_;
    bool finished_{false};
    std::chrono::steady_clock::time_point started_;
};

} // namespace spool::cli
