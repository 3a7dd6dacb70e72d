// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/cache_service.hpp>
#include <spool/core/byte_format.hpp>
#include <spool/core/log.hpp>
#include <shared_mutex>
#include <vector>

namespace spool::core {

CacheService::CacheService(std::shared_ptr<disk::BlobStore> store, CachingConfig config)
    : store_(std::move(store))
    , config_(config) {}

std::shared_ptr<CacheCoordinator> CacheService::coordinator(const ResourceKey& key) {
    auto lock = std::lock_guard(mutex_);
    auto it = coordinators_.find(key);
    if (it == coordinators_.end()) {
        it = coordinators_.emplace(key, CacheCoordinator::create(key, store_, config_)).first;
    }
    return it->second;
}

std::expected<std::shared_ptr<CacheCoordinator>, std::error_code>
CacheService::coordinator_for_url(std::string_view url) {
    auto key = ResourceKey::from_url(url);
    if (!key) {
        return std::unexpected(key.error());
    }
    return coordinator(*key);
}

double CacheService::cache_percentage(const ResourceKey& key) {
    auto meta = coordinator(key)->retrieve_metadata();
    return meta ? meta->percent_cached() : 0.0;
}

bool CacheService::is_cached(const ResourceKey& key) {
    return cache_percentage(key) >= FULLY_CACHED_PERCENT;
}

std::int64_t CacheService::cached_bytes(const ResourceKey& key) {
    auto meta = coordinator(key)->retrieve_metadata();
    return meta ? meta->cached_bytes() : 0;
}

std::uint64_t CacheService::total_size() const {
    return store_->byte_count();
}

std::error_code CacheService::clear() {
    auto lock = std::lock_guard(mutex_);

    // Every handed-out coordinator is held exclusively while the store is
    // emptied, so no commit can straddle the clear
    std::vector<std::unique_lock<std::shared_mutex>> held;
    held.reserve(coordinators_.size());
    for (auto& [key, coord] : coordinators_) {
        held.emplace_back(coord->mutex_);
    }

    const auto before = store_->byte_count();
    auto ec = store_->clear();

    // Reload from the store whatever is left
    for (auto& [key, coord] : coordinators_) {
        coord->forget_locked();
    }

    if (ec) {
        logger()->error("cache: clear failed: {}", ec.message());
        return ec;
    }
    logger()->info("cache: cleared {}", format_bytes(static_cast<std::int64_t>(before)));
    return {};
}

} // namespace spool::core
