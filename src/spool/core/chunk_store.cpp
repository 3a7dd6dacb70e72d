// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/chunk_store.hpp>
#include <spool/core/error.hpp>
#include <spool/core/log.hpp>

namespace spool::core {

std::error_code ChunkStore::put(const ResourceKey& key,
                                std::int64_t offset,
                                std::span<const std::byte> data) {
    if (offset < 0 || data.empty()) {
        return make_error_code(CacheErrc::invalid_range);
    }
    return store_.put(key.chunk_key(offset), data);
}

std::optional<Bytes> ChunkStore::get(const ResourceKey& key, std::int64_t offset) const {
    auto blob = store_.get(key.chunk_key(offset));
    if (!blob) {
        logger()->warn("chunk: cannot read {} @ {}: {}", key.str(), offset, blob.error().message());
        return std::nullopt;
    }
    return std::move(*blob);
}

std::vector<std::int64_t> ChunkStore::list_known_offsets(const ResourceKey& key) const {
    auto meta = metadata_.load(key);
    if (!meta || !*meta) return {};
    return (*meta)->chunk_offsets();
}

std::error_code ChunkStore::remove(const ResourceKey& key, std::int64_t offset) {
    return store_.remove(key.chunk_key(offset));
}

} // namespace spool::core
