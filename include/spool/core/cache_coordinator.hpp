// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/asset_metadata.hpp>
#include <spool/core/chunk_store.hpp>
#include <spool/core/config.hpp>
#include <spool/core/incremental_writer.hpp>
#include <spool/core/metadata_store.hpp>
#include <spool/core/resource_key.hpp>
#include <spool/disk/blob_store.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace spool::core {

enum class RetrieveStatus : std::uint8_t {
    Miss,     // nothing usable at the requested offset
    Partial,  // contiguous prefix shorter than requested
    Hit,      // exactly the requested bytes
};

struct RetrieveResult {
    RetrieveStatus status{RetrieveStatus::Miss};
    Bytes data;

    [[nodiscard]] bool is_hit() const noexcept { return status == RetrieveStatus::Hit; }
};

[[nodiscard]] constexpr const char* to_string(RetrieveStatus status) noexcept {
    switch (status) {
        case RetrieveStatus::Miss: return "miss";
        case RetrieveStatus::Partial: return "partial";
        case RetrieveStatus::Hit: return "hit";
    }
    return "unknown";
}

// Single point of mutation and query for one resource.
//
// Reads of the index and chunks run concurrently under a shared lock;
// chunk commits and metadata rewrites take it exclusively, so a commit is
// observed either completely or not at all. Concurrent identical
// retrievals are collapsed into one.
//
// Created through create(); write sessions hold a reference to their
// coordinator and keep it alive.
class CacheCoordinator : public std::enable_shared_from_this<CacheCoordinator> {
public:
    [[nodiscard]] static std::shared_ptr<CacheCoordinator>
    create(ResourceKey key, std::shared_ptr<disk::BlobStore> store, CachingConfig config = {});

    CacheCoordinator(const CacheCoordinator&) = delete;
    CacheCoordinator& operator=(const CacheCoordinator&) = delete;

    [[nodiscard]] const ResourceKey& key() const noexcept { return key_; }
    [[nodiscard]] const CachingConfig& config() const noexcept { return config_; }

    // Current record, nullopt if none has been stored or a pending legacy
    // upgrade cannot be completed yet
    [[nodiscard]] std::optional<AssetMetadata> retrieve_metadata();

    // Store or replace the content info, keeping ranges and chunks.
    // Fails with persistence_failed while a legacy upgrade is pending.
    [[nodiscard]] std::error_code save_content_info(const ContentInfo& info);

    // Persist one chunk: blob first, then offset and range, then the record.
    // Requires content info to have been saved. Bytes already indexed at
    // `offset` are not rewritten; only the uncovered tail is stored, under
    // its own chunk key.
    [[nodiscard]] std::error_code save_chunk(std::span<const std::byte> data, std::int64_t offset);

    [[nodiscard]] bool is_range_cached(std::int64_t offset, std::int64_t length);

    // Assemble [offset, offset + length) from stored chunks
    [[nodiscard]] RetrieveResult retrieve_range(std::int64_t offset, std::int64_t length);
    [[nodiscard]] std::future<RetrieveResult> retrieve_range_async(std::int64_t offset,
                                                                   std::int64_t length);

    // Readers currently waiting on an identical retrieval started by another
    [[nodiscard]] int joined_reads() const noexcept { return joined_reads_.load(); }

    [[nodiscard]] std::vector<CachedRange> cached_ranges();
    [[nodiscard]] std::vector<CachedRange> gaps(std::int64_t offset, std::int64_t length);

    // Begin buffering a range write at `start_offset`
    [[nodiscard]] std::expected<std::unique_ptr<IncrementalWriter>, std::error_code>
    open_session(std::int64_t start_offset);

    // Delete every chunk and the record of this resource
    [[nodiscard]] std::error_code remove_all();

    // Forget the in-memory record; the next query reloads it
    void invalidate();

private:
    friend class CacheService;

    CacheCoordinator(ResourceKey key, std::shared_ptr<disk::BlobStore> store,
                     CachingConfig config) noexcept;

    // Callers hold mutex_ exclusively. On failure nothing is cached and the
    // next call loads again.
    [[nodiscard]] std::error_code load_locked();

    // Callers hold mutex_ exclusively
    void forget_locked() noexcept;

    [[nodiscard]] RetrieveResult assemble(std::int64_t offset, std::int64_t length);

    ResourceKey key_;
    std::shared_ptr<disk::BlobStore> store_;
    MetadataStore metadata_store_;
    ChunkStore chunk_store_;
    CachingConfig config_;

    std::optional<AssetMetadata> metadata_;
    bool metadata_loaded_{false};
    mutable std::shared_mutex mutex_;

    using RangeKey = std::pair<std::int64_t, std::int64_t>;
    std::map<RangeKey, std::shared_future<RetrieveResult>> in_flight_;
    std::mutex in_flight_mutex_;
    std::atomic<int> joined_reads_{0};
};

} // namespace spool::core
