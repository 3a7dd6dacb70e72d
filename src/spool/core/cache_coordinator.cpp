// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/cache_coordinator.hpp>
#include <spool/core/byte_format.hpp>
#include <spool/core/error.hpp>
#include <spool/core/log.hpp>
#include <algorithm>
#include <exception>

namespace spool::core {

std::shared_ptr<CacheCoordinator>
CacheCoordinator::create(ResourceKey key, std::shared_ptr<disk::BlobStore> store,
                         CachingConfig config) {
    return std::shared_ptr<CacheCoordinator>(
        new CacheCoordinator(std::move(key), std::move(store), config));
}

CacheCoordinator::CacheCoordinator(ResourceKey key, std::shared_ptr<disk::BlobStore> store,
                                   CachingConfig config) noexcept
    : key_(std::move(key))
    , store_(std::move(store))
    , metadata_store_(*store_)
    , chunk_store_(*store_, metadata_store_)
    , config_(config) {}

std::error_code CacheCoordinator::load_locked() {
    if (metadata_loaded_) return {};

    auto loaded = metadata_store_.load(key_);
    if (!loaded) {
        return loaded.error();
    }
    metadata_ = std::move(*loaded);
    metadata_loaded_ = true;
    return {};
}

std::optional<AssetMetadata> CacheCoordinator::retrieve_metadata() {
    {
        auto lock = std::shared_lock(mutex_);
        if (metadata_loaded_) return metadata_;
    }
    auto lock = std::unique_lock(mutex_);
    if (load_locked()) {
        return std::nullopt;
    }
    return metadata_;
}

std::error_code CacheCoordinator::save_content_info(const ContentInfo& info) {
    auto lock = std::unique_lock(mutex_);

    if (auto ec = load_locked()) {
        logger()->warn("{}: content info not saved: {}", key_.str(), ec.message());
        return ec;
    }
    auto meta = metadata_.value_or(AssetMetadata{});
    meta.content_info = info;

    if (auto ec = metadata_store_.save(key_, meta)) {
        return ec;
    }
    metadata_ = std::move(meta);

    logger()->debug("{}: content info {} ({}), ranges {}", key_.str(),
                    format_bytes(info.content_length), info.content_type,
                    info.byte_range_supported ? "supported" : "unsupported");
    return {};
}

std::error_code CacheCoordinator::save_chunk(std::span<const std::byte> data, std::int64_t offset) {
    if (offset < 0 || data.empty()) {
        return make_error_code(CacheErrc::invalid_range);
    }
    const auto length = static_cast<std::int64_t>(data.size());

    auto lock = std::unique_lock(mutex_);

    if (auto ec = load_locked()) {
        logger()->warn("{}: chunk @ {} rejected: {}", key_.str(), offset, ec.message());
        return ec;
    }
    if (!metadata_ || metadata_->content_info.content_length <= 0) {
        logger()->warn("{}: chunk @ {} rejected, no content info", key_.str(), offset);
        return make_error_code(CacheErrc::no_content_info);
    }

    // Indexed blobs are never overwritten. Skip past chunks already stored at
    // the write position so a longer write only adds its tail.
    auto write_offset = offset;
    auto remaining = data;
    for (auto existing = metadata_->chunk_length(write_offset);
         existing && *existing > 0;
         existing = metadata_->chunk_length(write_offset)) {
        if (*existing >= static_cast<std::int64_t>(remaining.size())) {
            logger()->debug("{}: {} @ {} already stored", key_.str(), format_bytes(length), offset);
            return {};
        }
        write_offset += *existing;
        remaining = remaining.subspan(static_cast<std::size_t>(*existing));
    }
    if (metadata_->chunk_length(write_offset)) {
        // Recorded length unknown: the blob size decides, so never replace it
        logger()->debug("{}: chunk @ {} of unknown length kept", key_.str(), write_offset);
        return {};
    }
    const auto write_length = static_cast<std::int64_t>(remaining.size());

    if (auto ec = chunk_store_.put(key_, write_offset, remaining)) {
        logger()->error("{}: writing chunk @ {} failed: {}", key_.str(), write_offset, ec.message());
        return ec;
    }

    auto meta = *metadata_;
    if (auto ec = meta.add_chunk(write_offset, write_length)) {
        return ec;
    }
    if (auto ec = metadata_store_.save(key_, meta)) {
        // The blob stays orphaned and unindexed
        return ec;
    }
    metadata_ = std::move(meta);

    logger()->debug("{}: stored {} @ {}, {:.1f}% cached", key_.str(), format_bytes(write_length),
                    write_offset, metadata_->percent_cached());
    return {};
}

bool CacheCoordinator::is_range_cached(std::int64_t offset, std::int64_t length) {
    auto meta = retrieve_metadata();
    return meta && meta->cached_ranges.is_covered(offset, length);
}

RetrieveResult CacheCoordinator::retrieve_range(std::int64_t offset, std::int64_t length) {
    if (offset < 0 || length <= 0) {
        return {};
    }

    const RangeKey range{offset, length};
    std::promise<RetrieveResult> promise;
    std::shared_future<RetrieveResult> pending;
    {
        auto lock = std::lock_guard(in_flight_mutex_);
        if (auto it = in_flight_.find(range); it != in_flight_.end()) {
            pending = it->second;
        } else {
            in_flight_.emplace(range, promise.get_future().share());
        }
    }

    if (pending.valid()) {
        logger()->trace("{}: joining in-flight read {}+{}", key_.str(), offset, length);
        ++joined_reads_;
        try {
            auto joined = pending.get();
            --joined_reads_;
            return joined;
        } catch (const std::exception&) {
            --joined_reads_;
            throw;
        }
    }

    RetrieveResult result;
    try {
        result = assemble(offset, length);
    } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
        auto lock = std::lock_guard(in_flight_mutex_);
        in_flight_.erase(range);
        throw;
    }

    promise.set_value(result);
    {
        auto lock = std::lock_guard(in_flight_mutex_);
        in_flight_.erase(range);
    }
    return result;
}

std::future<RetrieveResult> CacheCoordinator::retrieve_range_async(std::int64_t offset,
                                                                   std::int64_t length) {
    return std::async(std::launch::async, [self = shared_from_this(), offset, length] {
        return self->retrieve_range(offset, length);
    });
}

RetrieveResult CacheCoordinator::assemble(std::int64_t offset, std::int64_t length) {
    RetrieveResult result;

    // The record must be loaded while the shared lock is held; an
    // invalidate() between loading and locking sends us round again
    auto lock = std::shared_lock(mutex_);
    while (!metadata_loaded_) {
        lock.unlock();
        {
            auto unique = std::unique_lock(mutex_);
            if (auto ec = load_locked()) {
                logger()->warn("{}: miss {}+{}, record unavailable: {}", key_.str(), offset,
                               length, ec.message());
                return result;
            }
        }
        lock.lock();
    }

    if (!metadata_) {
        logger()->trace("{}: miss {}+{}, no record", key_.str(), offset, length);
        return result;
    }

    const auto end = offset + length;
    auto cursor = offset;

    for (const auto& [chunk_offset, recorded] : metadata_->chunks) {
        if (chunk_offset >= end) break;
        if (recorded != UNKNOWN_CHUNK_LENGTH && chunk_offset + recorded <= cursor) continue;
        if (chunk_offset > cursor) break;  // gap

        auto blob = chunk_store_.get(key_, chunk_offset);
        if (!blob) {
            logger()->warn("{}: chunk @ {} indexed but missing", key_.str(), chunk_offset);
            break;
        }
        const auto blob_size = static_cast<std::int64_t>(blob->size());
        if (recorded != UNKNOWN_CHUNK_LENGTH && blob_size != recorded) {
            logger()->warn("{}: chunk @ {} is {} bytes, expected {}", key_.str(), chunk_offset,
                           blob_size, recorded);
            break;
        }
        if (chunk_offset + blob_size <= cursor) continue;

        const auto from = cursor - chunk_offset;
        const auto to = std::min(blob_size, end - chunk_offset);
        result.data.insert(result.data.end(), blob->begin() + from, blob->begin() + to);
        cursor = chunk_offset + to;

        if (cursor >= end) break;
    }

    if (cursor >= end) {
        result.status = RetrieveStatus::Hit;
    } else if (!result.data.empty()) {
        result.status = RetrieveStatus::Partial;
    }

    logger()->trace("{}: {} {}+{} -> {} bytes", key_.str(), to_string(result.status), offset,
                    length, result.data.size());
    return result;
}

std::vector<CachedRange> CacheCoordinator::cached_ranges() {
    auto meta = retrieve_metadata();
    if (!meta) return {};
    return meta->cached_ranges.ranges();
}

std::vector<CachedRange> CacheCoordinator::gaps(std::int64_t offset, std::int64_t length) {
    auto meta = retrieve_metadata();
    if (!meta) {
        if (offset < 0 || length <= 0) return {};
        return {CachedRange{offset, length}};
    }
    return meta->cached_ranges.gaps(offset, length);
}

std::expected<std::unique_ptr<IncrementalWriter>, std::error_code>
CacheCoordinator::open_session(std::int64_t start_offset) {
    if (start_offset < 0) {
        return std::unexpected(make_error_code(CacheErrc::invalid_range));
    }

    auto commit = [self = shared_from_this()](std::int64_t offset,
                                              std::span<const std::byte> data) {
        return self->save_chunk(data, offset);
    };

    logger()->debug("{}: session @ {} (threshold {}, incremental {})", key_.str(), start_offset,
                    format_bytes(static_cast<std::int64_t>(config_.flush_threshold())),
                    config_.incremental());
    return std::make_unique<IncrementalWriter>(start_offset, config_, std::move(commit));
}

std::error_code CacheCoordinator::remove_all() {
    auto lock = std::unique_lock(mutex_);

    if (auto ec = load_locked()) {
        // A legacy record that cannot be upgraded is removed as it stands
        logger()->warn("{}: removing unreadable record: {}", key_.str(), ec.message());
    }
    if (metadata_) {
        for (const auto& [chunk_offset, length] : metadata_->chunks) {
            if (auto ec = chunk_store_.remove(key_, chunk_offset)) {
                return ec;
            }
        }
    }
    if (auto ec = metadata_store_.remove(key_)) {
        return ec;
    }
    metadata_.reset();
    metadata_loaded_ = true;
    return {};
}

void CacheCoordinator::invalidate() {
    auto lock = std::unique_lock(mutex_);
    forget_locked();
}

void CacheCoordinator::forget_locked() noexcept {
    metadata_.reset();
    metadata_loaded_ = false;
}

} // namespace spool::core
