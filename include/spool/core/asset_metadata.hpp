// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/range_index.hpp>
#include <spool/disk/blob_store.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace spool::core {

using disk::Bytes;

// Recorded length of a chunk whose size the record does not carry
constexpr std::int64_t UNKNOWN_CHUNK_LENGTH = -1;

// What the origin told us about the resource
struct ContentInfo {
    std::int64_t content_length{0};
    std::string content_type;
    bool byte_range_supported{false};

    bool operator==(const ContentInfo&) const = default;
};

// Per-resource metadata record
struct AssetMetadata {
    ContentInfo content_info;
    RangeIndex cached_ranges;
    std::map<std::int64_t, std::int64_t> chunks;  // offset -> recorded length

    // Sorted, deduplicated
    [[nodiscard]] std::vector<std::int64_t> chunk_offsets() const;

    [[nodiscard]] std::optional<std::int64_t> chunk_length(std::int64_t offset) const;

    // Register a committed chunk and merge its range
    [[nodiscard]] std::error_code add_chunk(std::int64_t offset, std::int64_t length);

    [[nodiscard]] std::int64_t cached_bytes() const noexcept { return cached_ranges.total_bytes(); }

    // 0..100, 0 when the content length is unknown
    [[nodiscard]] double percent_cached() const noexcept;

    bool operator==(const AssetMetadata&) const = default;
};

// A decoded record under the resource key. Legacy records carry the whole
// payload inline and no range index.
struct MetadataRecord {
    AssetMetadata metadata;
    std::optional<Bytes> legacy_payload;
};

// Serialise to the current record shape (JSON document, CBOR encoded)
[[nodiscard]] Bytes encode_metadata(const AssetMetadata& meta);

// Parse either shape. Missing fields take defaults; undecodable input
// yields corrupt_record.
[[nodiscard]] std::expected<MetadataRecord, std::error_code>
decode_metadata(const Bytes& record) noexcept;

// Build a record in the legacy single-blob shape
[[nodiscard]] Bytes encode_legacy_record(const ContentInfo& info, const Bytes& payload);

} // namespace spool::core
