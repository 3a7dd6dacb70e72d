// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>

namespace spool::core {

// "128 bytes", "500.00 KB", "1.20 MB", "2.00 GB" (1024 base)
[[nodiscard]] std::string format_bytes(std::int64_t bytes);

} // namespace spool::core
