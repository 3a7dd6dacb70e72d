// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/disk/blob_store.hpp>

namespace spool::disk {

std::expected<std::optional<Bytes>, std::error_code>
MemoryBlobStore::get(std::string_view key) const {
    auto lock = std::lock_guard(mutex_);
    auto it = blobs_.find(key);
    if (it == blobs_.end()) {
        return std::optional<Bytes>{};
    }
    return std::optional<Bytes>{it->second};
}

std::error_code MemoryBlobStore::put(std::string_view key, std::span<const std::byte> data) {
    auto lock = std::lock_guard(mutex_);
    blobs_.insert_or_assign(std::string(key), Bytes(data.begin(), data.end()));
    return {};
}

std::error_code MemoryBlobStore::remove(std::string_view key) {
    auto lock = std::lock_guard(mutex_);
    if (auto it = blobs_.find(key); it != blobs_.end()) {
        blobs_.erase(it);
    }
    return {};
}

bool MemoryBlobStore::contains(std::string_view key) const {
    auto lock = std::lock_guard(mutex_);
    return blobs_.find(key) != blobs_.end();
}

std::uint64_t MemoryBlobStore::byte_count() const {
    auto lock = std::lock_guard(mutex_);
    std::uint64_t total = 0;
    for (const auto& [key, blob] : blobs_) {
        total += blob.size();
    }
    return total;
}

std::error_code MemoryBlobStore::clear() {
    auto lock = std::lock_guard(mutex_);
    blobs_.clear();
    return {};
}

std::size_t MemoryBlobStore::size() const {
    auto lock = std::lock_guard(mutex_);
    return blobs_.size();
}

std::vector<std::string> MemoryBlobStore::keys() const {
    auto lock = std::lock_guard(mutex_);
    std::vector<std::string> out;
    out.reserve(blobs_.size());
    for (const auto& [key, blob] : blobs_) {
        out.push_back(key);
    }
    return out;
}

} // namespace spool::disk
