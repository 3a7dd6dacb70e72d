// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/resource_key.hpp>
#include <spool/core/url.hpp>
#include <format>

namespace spool::core {

std::expected<ResourceKey, std::error_code> ResourceKey::from_url(std::string_view url) noexcept {
    auto parsed = Url::parse(url);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return ResourceKey(parsed->canonical());
}

std::expected<ResourceKey, std::error_code> ResourceKey::from_string(std::string_view key) noexcept {
    if (key.empty()) {
        return std::unexpected(make_error_code(CacheErrc::invalid_key));
    }
    return ResourceKey(std::string(key));
}

std::string ResourceKey::chunk_key(std::int64_t offset) const {
    return std::format("{}_chunk_{}", value_, offset);
}

} // namespace spool::core
