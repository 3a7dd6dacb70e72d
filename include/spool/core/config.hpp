// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace spool::core {

constexpr std::uint64_t DEFAULT_FLUSH_THRESHOLD = 512 * 1024;       // 512 KB
constexpr std::uint64_t MIN_FLUSH_THRESHOLD = 256 * 1024;           // 256 KB floor
constexpr std::uint64_t CONSERVATIVE_FLUSH_THRESHOLD = 1024 * 1024; // 1 MB

constexpr double FULLY_CACHED_PERCENT = 99.0;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr std::size_t RECEIVE_BUFFER_SIZE = 64 * 1024;

// Flush policy for write sessions
class CachingConfig {
public:
    // 512 KB, incremental flushing on
    CachingConfig() = default;

    [[nodiscard]] static std::expected<CachingConfig, std::error_code>
    create(std::uint64_t flush_threshold, bool incremental) noexcept;

    // Presets
    [[nodiscard]] static CachingConfig defaults() noexcept { return {}; }
    [[nodiscard]] static CachingConfig conservative() noexcept {
        return CachingConfig(CONSERVATIVE_FLUSH_THRESHOLD, true);
    }
    [[nodiscard]] static CachingConfig aggressive() noexcept {
        return CachingConfig(MIN_FLUSH_THRESHOLD, true);
    }
    // Flush only when a session ends; loses everything on a crash
    [[nodiscard]] static CachingConfig disabled() noexcept {
        return CachingConfig(DEFAULT_FLUSH_THRESHOLD, false);
    }

    [[nodiscard]] std::uint64_t flush_threshold() const noexcept { return flush_threshold_; }
    [[nodiscard]] bool incremental() const noexcept { return incremental_; }

    bool operator==(const CachingConfig&) const = default;

private:
    CachingConfig(std::uint64_t threshold, bool incremental) noexcept
        : flush_threshold_(threshold), incremental_(incremental) {}

    std::uint64_t flush_threshold_{DEFAULT_FLUSH_THRESHOLD};
    bool incremental_{true};
};

// Where the on-disk store lives
struct StorageConfig {
    std::string cache_dir;
    std::string name{"VideoCache"};

    // $XDG_CACHE_HOME/spool-cache, falling back to ~/.cache/spool-cache
    [[nodiscard]] static std::string default_cache_dir();
};

struct Config {
    CachingConfig caching;
    StorageConfig storage;
    std::string log_level{"info"};

    // Load from a JSON file; missing keys keep their defaults
    [[nodiscard]] static std::expected<Config, std::error_code>
    load(std::string_view path) noexcept;

    // Parse from JSON text
    [[nodiscard]] static std::expected<Config, std::error_code>
    parse(std::string_view json_text) noexcept;

    [[nodiscard]] std::error_code save(std::string_view path) const noexcept;
};

} // namespace spool::core
