// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace spool::core {

// Stable identifier of one cached resource; the same locator always yields
// the same key, across restarts.
class ResourceKey {
public:
    // Canonical form of the URL (see Url::canonical)
    [[nodiscard]] static std::expected<ResourceKey, std::error_code>
    from_url(std::string_view url) noexcept;

    // Any non-empty identifier
    [[nodiscard]] static std::expected<ResourceKey, std::error_code>
    from_string(std::string_view key) noexcept;

    [[nodiscard]] const std::string& str() const noexcept { return value_; }

    // Storage key of the blob holding the chunk that starts at `offset`
    [[nodiscard]] std::string chunk_key(std::int64_t offset) const;

    auto operator<=>(const ResourceKey&) const = default;

private:
    explicit ResourceKey(std::string value) noexcept : value_(std::move(value)) {}

    std::string value_;
};

} // namespace spool::core

template<>
struct std::hash<spool::core::ResourceKey> {
    std::size_t operator()(const spool::core::ResourceKey& key) const noexcept {
        return std::hash<std::string>{}(key.str());
    }
};
