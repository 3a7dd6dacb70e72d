// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace spool::core {

// Shared "spool" logger writing to stderr
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Accepts trace|debug|info|warn|error|critical|off
[[nodiscard]] bool is_valid_log_level(std::string_view level) noexcept;

// Returns false (and leaves the level untouched) for unknown names
bool set_log_level(std::string_view level);

} // namespace spool::core
