// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <array>
#include <string>

namespace spool::core {

namespace {

constexpr std::array<std::string_view, 7> LEVEL_NAMES{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get("spool")) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt("spool");
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

bool is_valid_log_level(std::string_view level) noexcept {
    for (auto name : LEVEL_NAMES) {
        if (name == level) return true;
    }
    return false;
}

bool set_log_level(std::string_view level) {
    if (!is_valid_log_level(level)) {
        return false;
    }
    logger()->set_level(spdlog::level::from_str(std::string(level)));
    return true;
}

} // namespace spool::core
