// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/disk/blob_store.hpp>
#include <atomic>
#include <filesystem>
#include <memory>

namespace spool::disk {

// One file per key inside a cache directory. Writes land in a temporary
// file that is renamed over the target, so a crash never leaves a torn value.
class FileBlobStore final : public BlobStore {
public:
    // Creates the directory if needed
    [[nodiscard]] static std::expected<std::unique_ptr<FileBlobStore>, std::error_code>
    open(const std::filesystem::path& dir) noexcept;

    [[nodiscard]] std::expected<std::optional<Bytes>, std::error_code>
    get(std::string_view key) const override;
    [[nodiscard]] std::error_code put(std::string_view key,
                                      std::span<const std::byte> data) override;
    [[nodiscard]] std::error_code remove(std::string_view key) override;
    [[nodiscard]] bool contains(std::string_view key) const override;
    [[nodiscard]] std::uint64_t byte_count() const override;
    [[nodiscard]] std::error_code clear() override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

    // File name a key is stored under: percent-encoded, long names shortened
    // with a hash suffix
    [[nodiscard]] static std::string file_name(std::string_view key);

private:
    explicit FileBlobStore(std::filesystem::path dir) noexcept : dir_(std::move(dir)) {}

    [[nodiscard]] std::filesystem::path path_for(std::string_view key) const;

    std::filesystem::path dir_;
    std::atomic<std::uint64_t> temp_counter_{0};
};

} // namespace spool::disk
