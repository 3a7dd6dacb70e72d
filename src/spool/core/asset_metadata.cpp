// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/asset_metadata.hpp>
#include <spool/core/error.hpp>
#include <spool/version.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace spool::core {

using nlohmann::json;

namespace {

// Record fields
constexpr auto KEY_VERSION = "version";
constexpr auto KEY_CONTENT_LENGTH = "contentLength";
constexpr auto KEY_CONTENT_TYPE = "contentType";
constexpr auto KEY_RANGE_SUPPORT = "isByteRangeAccessSupported";
constexpr auto KEY_RANGES = "cachedRanges";
constexpr auto KEY_CHUNK_OFFSETS = "chunkOffsets";
constexpr auto KEY_CHUNK_LENGTHS = "chunkLengths";

// Legacy fields
constexpr auto KEY_LEGACY_INFO = "contentInformation";
constexpr auto KEY_LEGACY_DATA = "mediaData";

ContentInfo read_content_info(const json& j) {
    ContentInfo info;
    info.content_length = j.value(KEY_CONTENT_LENGTH, std::int64_t{0});
    info.content_type = j.value(KEY_CONTENT_TYPE, std::string{});
    info.byte_range_supported = j.value(KEY_RANGE_SUPPORT, false);
    return info;
}

void write_content_info(json& j, const ContentInfo& info) {
    j[KEY_CONTENT_LENGTH] = info.content_length;
    j[KEY_CONTENT_TYPE] = info.content_type;
    j[KEY_RANGE_SUPPORT] = info.byte_range_supported;
}

Bytes to_bytes(const std::vector<std::uint8_t>& raw) {
    Bytes out(raw.size());
    std::transform(raw.begin(), raw.end(), out.begin(),
                   [](std::uint8_t b) { return std::byte{b}; });
    return out;
}

std::vector<std::uint8_t> to_raw(const Bytes& bytes) {
    std::vector<std::uint8_t> out(bytes.size());
    std::transform(bytes.begin(), bytes.end(), out.begin(),
                   [](std::byte b) { return std::to_integer<std::uint8_t>(b); });
    return out;
}

} // namespace

//=============================================================================
// AssetMetadata
//=============================================================================

std::vector<std::int64_t> AssetMetadata::chunk_offsets() const {
    std::vector<std::int64_t> offsets;
    offsets.reserve(chunks.size());
    for (const auto& [offset, length] : chunks) {
        offsets.push_back(offset);
    }
    return offsets;
}

std::optional<std::int64_t> AssetMetadata::chunk_length(std::int64_t offset) const {
    auto it = chunks.find(offset);
    if (it == chunks.end()) return std::nullopt;
    return it->second;
}

std::error_code AssetMetadata::add_chunk(std::int64_t offset, std::int64_t length) {
    if (auto ec = cached_ranges.add_range(offset, length)) {
        return ec;
    }
    chunks[offset] = length;
    return {};
}

double AssetMetadata::percent_cached() const noexcept {
    if (content_info.content_length <= 0) return 0.0;
    double pct = static_cast<double>(cached_bytes()) * 100.0 /
                 static_cast<double>(content_info.content_length);
    return std::clamp(pct, 0.0, 100.0);
}

//=============================================================================
// Record encoding
//=============================================================================

Bytes encode_metadata(const AssetMetadata& meta) {
    json j;
    j[KEY_VERSION] = METADATA_FORMAT_VERSION;
    write_content_info(j, meta.content_info);

    auto ranges = json::array();
    for (const auto& r : meta.cached_ranges.ranges()) {
        ranges.push_back({{"offset", r.offset}, {"length", r.length}});
    }
    j[KEY_RANGES] = std::move(ranges);

    auto offsets = json::array();
    auto lengths = json::array();
    for (const auto& [offset, length] : meta.chunks) {
        offsets.push_back(offset);
        lengths.push_back(length);
    }
    j[KEY_CHUNK_OFFSETS] = std::move(offsets);
    j[KEY_CHUNK_LENGTHS] = std::move(lengths);

    return to_bytes(json::to_cbor(j));
}

Bytes encode_legacy_record(const ContentInfo& info, const Bytes& payload) {
    json content;
    write_content_info(content, info);

    json j;
    j[KEY_LEGACY_INFO] = std::move(content);
    j[KEY_LEGACY_DATA] = json::binary(to_raw(payload));
    return to_bytes(json::to_cbor(j));
}

std::expected<MetadataRecord, std::error_code> decode_metadata(const Bytes& record) noexcept {
    try {
        auto j = json::from_cbor(to_raw(record), true, false);
        if (j.is_discarded() || !j.is_object()) {
            return std::unexpected(make_error_code(CacheErrc::corrupt_record));
        }

        MetadataRecord result;
        auto& meta = result.metadata;

        if (auto it = j.find(KEY_LEGACY_INFO); it != j.end() && it->is_object()) {
            meta.content_info = read_content_info(*it);
        } else {
            meta.content_info = read_content_info(j);
        }

        if (auto it = j.find(KEY_RANGES); it != j.end() && it->is_array()) {
            for (const auto& r : *it) {
                auto offset = r.value("offset", std::int64_t{-1});
                auto length = r.value("length", std::int64_t{0});
                // Malformed entries are skipped, not fatal
                (void)meta.cached_ranges.add_range(offset, length);
            }
        }

        if (auto it = j.find(KEY_CHUNK_OFFSETS); it != j.end() && it->is_array()) {
            std::vector<std::int64_t> lengths;
            if (auto lit = j.find(KEY_CHUNK_LENGTHS); lit != j.end() && lit->is_array()) {
                lengths = lit->get<std::vector<std::int64_t>>();
            }
            const auto offsets = it->get<std::vector<std::int64_t>>();
            // Lengths are only trusted when they line up with the offsets
            const bool have_lengths = lengths.size() == offsets.size();
            for (std::size_t i = 0; i < offsets.size(); ++i) {
                if (offsets[i] < 0) continue;
                meta.chunks[offsets[i]] = have_lengths ? lengths[i] : UNKNOWN_CHUNK_LENGTH;
            }
        }

        if (auto it = j.find(KEY_LEGACY_DATA); it != j.end() && it->is_binary()) {
            result.legacy_payload = to_bytes(it->get_binary());
        }

        return result;
    } catch (const json::exception&) {
        return std::unexpected(make_error_code(CacheErrc::corrupt_record));
    }
}

} // namespace spool::core
