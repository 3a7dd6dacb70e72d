// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/cli/progress_bar.hpp>
#include <spool/core/byte_format.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace spool::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

ProgressBar::ProgressBar(std::int64_t total, std::string_view label)
    : total_(total)
    , label_(label)
    , started_(std::chrono::steady_clock::now()) {}

void ProgressBar::update(std::int64_t current) noexcept {
    if (total_ <= 0 || finished_) return;
    if (first_ < 0) first_ = current;

    double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    // Only redraw every 1%
    const int scaled = static_cast<int>(percent);
    if (scaled <= last_percent_) return;
    last_percent_ = scaled;

    draw(current);
}

void ProgressBar::draw(std::int64_t current) noexcept {
    const double percent = std::clamp(
        static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0);
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }
    line += '[';
    line.append(static_cast<std::size_t>(filled), '=');
    line += '>';
    line.append(static_cast<std::size_t>(BAR_WIDTH - filled), ' ');
    line += std::format("] {:3}% ({}/{})", static_cast<int>(percent),
                        core::format_bytes(current), core::format_bytes(total_));

    // Speed only counts bytes received in this run
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
    auto received = current - std::max<std::int64_t>(first_, 0);
    if (elapsed > 0.5 && received > 0) {
        double speed = static_cast<double>(received) / elapsed;
        line += " @ ";
        line += format_speed(speed);
        if (auto remaining = total_ - current; remaining > 0) {
            line += " ETA: ";
            line += format_time(static_cast<std::uint64_t>(static_cast<double>(remaining) / speed));
        }
    }
    line.append(10, ' ');

    std::cerr << line << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    if (total_ > 0) draw(total_);
    finished_ = true;
    std::cerr << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cerr << "\r" << std::string(100, ' ') << "\r" << std::flush;
}

std::string ProgressBar::format_speed(double bytes_per_sec) {
    return core::format_bytes(static_cast<std::int64_t>(bytes_per_sec)) + "/s";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return std::format("{}h {:02}m {}s", hours, minutes, secs);
    } else if (minutes > 0) {
        return std::format("{}m {}s", minutes, secs);
    }
    return std::format("{}s", secs);
}

} // namespace spool::cli
