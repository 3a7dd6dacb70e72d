// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/asset_metadata.hpp>
#include <spool/core/resource_key.hpp>
#include <spool/disk/blob_store.hpp>
#include <expected>
#include <optional>
#include <system_error>

namespace spool::core {

// Loads and saves the metadata record stored under each resource key
class MetadataStore {
public:
    explicit MetadataStore(disk::BlobStore& store) noexcept : store_(store) {}

    // nullopt when there is no record or it cannot be read or decoded.
    // A legacy single-blob record is upgraded in place on first load: its
    // payload becomes chunk 0 and the record is rewritten in the current shape.
    // persistence_failed if the payload could not be moved; the legacy record
    // is left untouched and the next load tries again.
    [[nodiscard]] std::expected<std::optional<AssetMetadata>, std::error_code>
    load(const ResourceKey& key);

    [[nodiscard]] std::error_code save(const ResourceKey& key, const AssetMetadata& meta);

    [[nodiscard]] std::error_code remove(const ResourceKey& key);

private:
    [[nodiscard]] std::expected<AssetMetadata, std::error_code>
    migrate_legacy(const ResourceKey& key, AssetMetadata meta, const Bytes& payload);

    disk::BlobStore& store_;
};

} // namespace spool::core
