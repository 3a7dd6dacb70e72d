// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/config.hpp>
#include <spool/core/error.hpp>
#include <spool/core/log.hpp>
#include <spool/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace spool::core {

namespace fs = std::filesystem;

//=============================================================================
// CachingConfig
//=============================================================================

std::expected<CachingConfig, std::error_code>
CachingConfig::create(std::uint64_t flush_threshold, bool incremental) noexcept {
    if (flush_threshold < MIN_FLUSH_THRESHOLD) {
        return std::unexpected(make_error_code(CacheErrc::invalid_threshold));
    }
    return CachingConfig(flush_threshold, incremental);
}

//=============================================================================
// StorageConfig
//=============================================================================

std::string StorageConfig::default_cache_dir() {
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return (fs::path(xdg) / "spool-cache").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (fs::path(home) / ".cache" / "spool-cache").string();
    }
    return (fs::temp_directory_path() / "spool-cache").string();
}

//=============================================================================
// Config
//=============================================================================

// Layout:
// {
//   "caching": { "flushThreshold": 524288, "incremental": true },
//   "storage": { "cacheDir": "/var/cache/spool", "name": "VideoCache" },
//   "logLevel": "info"
// }
std::expected<Config, std::error_code> Config::parse(std::string_view json_text) noexcept {
    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(CacheErrc::invalid_config));
        }

        Config cfg;

        if (auto it = j.find("caching"); it != j.end() && it->is_object()) {
            auto threshold = it->value("flushThreshold", DEFAULT_FLUSH_THRESHOLD);
            auto incremental = it->value("incremental", true);
            auto caching = CachingConfig::create(threshold, incremental);
            if (!caching) {
                logger()->warn("config: flushThreshold {} is below the {} byte minimum",
                               threshold, MIN_FLUSH_THRESHOLD);
                return std::unexpected(make_error_code(CacheErrc::invalid_config));
            }
            cfg.caching = *caching;
        }

        if (auto it = j.find("storage"); it != j.end() && it->is_object()) {
            cfg.storage.cache_dir = it->value("cacheDir", std::string{});
            cfg.storage.name = it->value("name", cfg.storage.name);
        }

        cfg.log_level = j.value("logLevel", cfg.log_level);
        if (!is_valid_log_level(cfg.log_level)) {
            logger()->warn("config: unknown logLevel '{}'", cfg.log_level);
            return std::unexpected(make_error_code(CacheErrc::invalid_config));
        }

        return cfg;
    } catch (const nlohmann::json::exception& e) {
        logger()->warn("config: {}", e.what());
        return std::unexpected(make_error_code(CacheErrc::invalid_config));
    }
}

std::expected<Config, std::error_code> Config::load(std::string_view path) noexcept {
    std::ifstream file{std::string(path), std::ios::binary};
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse(contents.str());
}

std::error_code Config::save(std::string_view path) const noexcept {
    try {
        nlohmann::json j;
        j["caching"] = {
            {"flushThreshold", caching.flush_threshold()},
            {"incremental", caching.incremental()},
        };
        j["storage"] = {
            {"cacheDir", storage.cache_dir},
            {"name", storage.name},
        };
        j["logLevel"] = log_level;

        fs::path p(path);
        if (p.has_parent_path()) {
            fs::create_directories(p.parent_path());
        }

        std::ofstream file(p, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        file << j.dump(2) << '\n';
        return file ? std::error_code{} : make_error_code(disk::DiskErrc::write_error);
    } catch (const fs::filesystem_error& e) {
        return disk::from_system_error(e.code(), disk::DiskErrc::write_error);
    }
}

} // namespace spool::core
