// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spool::disk {

using Bytes = std::vector<std::byte>;

// Key/value storage every persistent record goes through. Implementations
// must be safe to call from several threads at once.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    // nullopt when the key is absent; an error when it exists but cannot be read
    [[nodiscard]] virtual std::expected<std::optional<Bytes>, std::error_code>
    get(std::string_view key) const = 0;

    // Replace the value atomically: readers see the old or the new value
    [[nodiscard]] virtual std::error_code put(std::string_view key,
                                              std::span<const std::byte> data) = 0;

    // Removing an absent key succeeds
    [[nodiscard]] virtual std::error_code remove(std::string_view key) = 0;

    [[nodiscard]] virtual bool contains(std::string_view key) const = 0;

    // Total bytes of stored values
    [[nodiscard]] virtual std::uint64_t byte_count() const = 0;

    [[nodiscard]] virtual std::error_code clear() = 0;
};

// In-process store, used by tests and as a scratch cache
class MemoryBlobStore final : public BlobStore {
public:
    MemoryBlobStore() = default;

    [[nodiscard]] std::expected<std::optional<Bytes>, std::error_code>
    get(std::string_view key) const override;
    [[nodiscard]] std::error_code put(std::string_view key,
                                      std::span<const std::byte> data) override;
    [[nodiscard]] std::error_code remove(std::string_view key) override;
    [[nodiscard]] bool contains(std::string_view key) const override;
    [[nodiscard]] std::uint64_t byte_count() const override;
    [[nodiscard]] std::error_code clear() override;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    std::map<std::string, Bytes, std::less<>> blobs_;
    mutable std::mutex mutex_;
};

} // namespace spool::disk
