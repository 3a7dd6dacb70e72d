// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/metadata_store.hpp>
#include <spool/core/resource_key.hpp>
#include <spool/disk/blob_store.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace spool::core {

// Chunk blobs stored under "{resourceKey}_chunk_{offset}"
class ChunkStore {
public:
    ChunkStore(disk::BlobStore& store, MetadataStore& metadata) noexcept
        : store_(store), metadata_(metadata) {}

    // Persist the blob only. The caller registers the offset and merges the
    // range afterwards, never before.
    [[nodiscard]] std::error_code put(const ResourceKey& key,
                                      std::int64_t offset,
                                      std::span<const std::byte> data);

    // nullopt when absent or unreadable
    [[nodiscard]] std::optional<Bytes> get(const ResourceKey& key, std::int64_t offset) const;

    // Offsets recorded in the resource's metadata, ascending
    [[nodiscard]] std::vector<std::int64_t> list_known_offsets(const ResourceKey& key) const;

    [[nodiscard]] std::error_code remove(const ResourceKey& key, std::int64_t offset);

private:
    disk::BlobStore& store_;
    MetadataStore& metadata_;
};

} // namespace spool::core
