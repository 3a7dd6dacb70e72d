// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/cache_coordinator.hpp>
#include <spool/core/config.hpp>
#include <spool/core/resource_key.hpp>
#include <spool/disk/blob_store.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <system_error>

namespace spool::core {

// Cache-wide entry point: hands out one coordinator per resource and
// answers questions about the store as a whole.
class CacheService {
public:
    explicit CacheService(std::shared_ptr<disk::BlobStore> store, CachingConfig config = {});

    // Same coordinator for the same key for the life of the service
    [[nodiscard]] std::shared_ptr<CacheCoordinator> coordinator(const ResourceKey& key);

    [[nodiscard]] std::expected<std::shared_ptr<CacheCoordinator>, std::error_code>
    coordinator_for_url(std::string_view url);

    // 0..100; 0 when the resource is unknown or its length is
    [[nodiscard]] double cache_percentage(const ResourceKey& key);

    // At least 99% of the resource is stored
    [[nodiscard]] bool is_cached(const ResourceKey& key);

    [[nodiscard]] std::int64_t cached_bytes(const ResourceKey& key);

    // Bytes occupied by every record and chunk in the store
    [[nodiscard]] std::uint64_t total_size() const;

    // Drop everything. Coordinators already handed out stay the ones this
    // service returns for their keys and see an empty cache.
    [[nodiscard]] std::error_code clear();

    [[nodiscard]] const CachingConfig& config() const noexcept { return config_; }
    [[nodiscard]] disk::BlobStore& store() noexcept { return *store_; }

private:
    std::shared_ptr<disk::BlobStore> store_;
    CachingConfig config_;

    std::map<ResourceKey, std::shared_ptr<CacheCoordinator>> coordinators_;
    mutable std::mutex mutex_;
};

} // namespace spool::core
