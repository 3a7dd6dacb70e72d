// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/cache_service.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace spool::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Inclusive "START-END" as given on the command line
struct ByteRange {
    std::int64_t offset{0};
    std::int64_t length{0};
};

// Command line arguments
struct CliArgs {
    std::string command;           // fetch | read | info | stats | clear
    std::string url;
    std::optional<ByteRange> range;
    std::uint64_t flush_threshold{0};  // 0 keeps the configured value
    bool no_incremental{false};
    std::string output_file;
    std::string cache_dir;
    std::string config_file;
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;             // first parse error, if any
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// "START-END", both inclusive; "START-" means to the end (length 0)
[[nodiscard]] std::optional<ByteRange> parse_range(std::string_view text) noexcept;

// Download the missing parts of a range (default: the whole resource)
[[nodiscard]] CliResult fetch(core::CacheService& service, const CliArgs& args) noexcept;

// Serve a range from the cache only
[[nodiscard]] CliResult read(core::CacheService& service, const CliArgs& args) noexcept;

// What the cache holds for one resource
[[nodiscard]] CliResult info(core::CacheService& service, const CliArgs& args) noexcept;

[[nodiscard]] CliResult stats(core::CacheService& service, std::string_view location) noexcept;

[[nodiscard]] CliResult clear(core::CacheService& service) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace spool::cli
