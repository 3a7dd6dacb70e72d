// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <spool/core/config.hpp>
#include <spool/core/error.hpp>
#include <spool/core/log.hpp>
#include "test_helpers.hpp"

using namespace spool::core;

TEST_CASE("CachingConfig presets", "[config]") {
    CHECK(CachingConfig::defaults().flush_threshold() == 512 * 1024);
    CHECK(CachingConfig::defaults().incremental());
    CHECK(CachingConfig::conservative().flush_threshold() == 1024 * 1024);
    CHECK(CachingConfig::aggressive().flush_threshold() == 256 * 1024);
    CHECK(CachingConfig::aggressive().incremental());
    CHECK_FALSE(CachingConfig::disabled().incremental());
    CHECK(CachingConfig{} == CachingConfig::defaults());
}

TEST_CASE("CachingConfig::create", "[config]") {
    SECTION("Accepts the minimum and above") {
        auto config = CachingConfig::create(MIN_FLUSH_THRESHOLD, true);
        REQUIRE(config.has_value());
        CHECK(config->flush_threshold() == MIN_FLUSH_THRESHOLD);

        CHECK(CachingConfig::create(10 * 1024 * 1024, false).has_value());
    }

    SECTION("Rejects thresholds below 256 KB") {
        auto config = CachingConfig::create(MIN_FLUSH_THRESHOLD - 1, true);
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error() == make_error_code(CacheErrc::invalid_threshold));
        CHECK_FALSE(CachingConfig::create(0, true).has_value());
    }
}

TEST_CASE("Config::parse", "[config]") {
    SECTION("Empty object keeps defaults") {
        auto config = Config::parse("{}");
        REQUIRE(config.has_value());
        CHECK(config->caching == CachingConfig::defaults());
        CHECK(config->storage.name == "VideoCache");
        CHECK(config->storage.cache_dir.empty());
        CHECK(config->log_level == "info");
    }

    SECTION("All keys") {
        auto config = Config::parse(R"({
            "caching": { "flushThreshold": 1048576, "incremental": false },
            "storage": { "cacheDir": "/var/cache/spool", "name": "Podcasts" },
            "logLevel": "debug"
        })");
        REQUIRE(config.has_value());
        CHECK(config->caching.flush_threshold() == 1048576);
        CHECK_FALSE(config->caching.incremental());
        CHECK(config->storage.cache_dir == "/var/cache/spool");
        CHECK(config->storage.name == "Podcasts");
        CHECK(config->log_level == "debug");
    }

    SECTION("Invalid values") {
        const auto invalid = make_error_code(CacheErrc::invalid_config);
        CHECK(Config::parse(R"({"caching": {"flushThreshold": 1000}})").error() == invalid);
        CHECK(Config::parse(R"({"caching": {"flushThreshold": "big"}})").error() == invalid);
        CHECK(Config::parse(R"({"logLevel": "chatty"})").error() == invalid);
        CHECK(Config::parse("[1, 2]").error() == invalid);
        CHECK(Config::parse("{ not json").error() == invalid);
    }
}

TEST_CASE("Config save and load", "[config]") {
    spool::test::TempDir dir("config");
    const auto path = (dir.path() / "nested" / "spool.json").string();

    Config original;
    original.caching = CachingConfig::conservative();
    original.storage.cache_dir = "/tmp/spool-test";
    original.log_level = "warn";

    REQUIRE_FALSE(original.save(path));

    auto loaded = Config::load(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->caching == original.caching);
    CHECK(loaded->storage.cache_dir == original.storage.cache_dir);
    CHECK(loaded->storage.name == original.storage.name);
    CHECK(loaded->log_level == original.log_level);

    SECTION("Missing file") {
        auto missing = Config::load((dir.path() / "absent.json").string());
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error() == make_error_code(spool::disk::DiskErrc::file_not_found));
    }
}

TEST_CASE("Log levels", "[config]") {
    CHECK(is_valid_log_level("trace"));
    CHECK(is_valid_log_level("off"));
    CHECK_FALSE(is_valid_log_level("verbose"));

    CHECK(set_log_level("error"));
    CHECK(logger()->level() == spdlog::level::err);
    CHECK_FALSE(set_log_level("loud"));
    CHECK(logger()->level() == spdlog::level::err);
    CHECK(set_log_level("info"));
}
