// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/metadata_store.hpp>
#include <spool/core/byte_format.hpp>
#include <spool/core/error.hpp>
#include <spool/core/log.hpp>

namespace spool::core {

std::expected<std::optional<AssetMetadata>, std::error_code>
MetadataStore::load(const ResourceKey& key) {
    auto record = store_.get(key.str());
    if (!record) {
        logger()->warn("metadata: cannot read record for {}: {}", key.str(), record.error().message());
        return std::nullopt;
    }
    if (!*record) {
        return std::nullopt;
    }

    auto decoded = decode_metadata(**record);
    if (!decoded) {
        logger()->warn("metadata: discarding undecodable record for {}", key.str());
        return std::nullopt;
    }

    if (decoded->legacy_payload && decoded->metadata.cached_ranges.empty()) {
        auto migrated = migrate_legacy(key, std::move(decoded->metadata), *decoded->legacy_payload);
        if (!migrated) {
            return std::unexpected(migrated.error());
        }
        return std::move(*migrated);
    }
    return std::move(decoded->metadata);
}

std::error_code MetadataStore::save(const ResourceKey& key, const AssetMetadata& meta) {
    auto ec = store_.put(key.str(), encode_metadata(meta));
    if (ec) {
        logger()->error("metadata: save failed for {}: {}", key.str(), ec.message());
    }
    return ec;
}

std::error_code MetadataStore::remove(const ResourceKey& key) {
    return store_.remove(key.str());
}

std::expected<AssetMetadata, std::error_code>
MetadataStore::migrate_legacy(const ResourceKey& key, AssetMetadata meta, const Bytes& payload) {
    const auto length = static_cast<std::int64_t>(payload.size());

    if (length > 0) {
        // Blob first, then the record that points at it
        if (auto ec = store_.put(key.chunk_key(0), payload)) {
            logger()->error("metadata: legacy migration of {} failed: {}", key.str(), ec.message());
            return std::unexpected(make_error_code(CacheErrc::persistence_failed));
        }
        if (auto ec = meta.add_chunk(0, length)) {
            return std::unexpected(ec);
        }
    }

    if (auto ec = save(key, meta)) {
        // Chunk 0 already holds the payload and the legacy record is still
        // in place, so the next save or load completes the upgrade
        return meta;
    }

    logger()->info("metadata: migrated legacy record for {} (1 range, {})",
                   key.str(), format_bytes(length));
    return meta;
}

} // namespace spool::core
