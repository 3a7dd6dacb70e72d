// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/disk/file_blob_store.hpp>
#include <cctype>
#include <format>
#include <fstream>
#include <vector>

namespace spool::disk {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t MAX_NAME_LENGTH = 200;
constexpr std::size_t SHORTENED_PREFIX = 160;

// Temporary files start with '~', which never begins an encoded key
constexpr char TEMP_PREFIX = '~';

std::uint64_t fnv1a(std::string_view s) noexcept {
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (char c : s) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

bool is_temp_file(const fs::path& p) {
    auto name = p.filename().string();
    return !name.empty() && name.front() == TEMP_PREFIX;
}

} // namespace

std::expected<std::unique_ptr<FileBlobStore>, std::error_code>
FileBlobStore::open(const fs::path& dir) noexcept {
    if (dir.empty()) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(from_system_error(ec, DiskErrc::invalid_path));
    }
    if (!fs::is_directory(dir, ec)) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    // Leftovers of writes interrupted by a crash
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (is_temp_file(it->path())) {
            std::error_code rm_ec;
            fs::remove(it->path(), rm_ec);
        }
    }

    return std::unique_ptr<FileBlobStore>(new FileBlobStore(dir));
}

std::string FileBlobStore::file_name(std::string_view key) {
    std::string name;
    name.reserve(key.size());
    for (std::size_t i = 0; i < key.size(); ++i) {
        auto c = static_cast<unsigned char>(key[i]);
        bool keep = std::isalnum(c) || c == '-' || c == '_' || (c == '.' && i > 0);
        if (keep) {
            name += static_cast<char>(c);
        } else {
            name += std::format("%{:02X}", c);
        }
    }

    if (name.size() > MAX_NAME_LENGTH) {
        name = std::format("{}~{:016x}", name.substr(0, SHORTENED_PREFIX), fnv1a(key));
    }
    return name;
}

fs::path FileBlobStore::path_for(std::string_view key) const {
    return dir_ / file_name(key);
}

std::expected<std::optional<Bytes>, std::error_code>
FileBlobStore::get(std::string_view key) const {
    auto path = path_for(key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) return std::unexpected(from_system_error(ec, DiskErrc::read_error));
        return std::optional<Bytes>{};
    }

    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected(from_system_error(ec, DiskErrc::read_error));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }

    Bytes data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (static_cast<std::uintmax_t>(file.gcount()) != size) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
    return std::optional<Bytes>{std::move(data)};
}

std::error_code FileBlobStore::put(std::string_view key, std::span<const std::byte> data) {
    auto target = path_for(key);
    auto temp = dir_ / std::format("{}{}.{}", TEMP_PREFIX, file_name(key),
                                   temp_counter_.fetch_add(1, std::memory_order_relaxed));

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error_code(DiskErrc::write_error);
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            std::error_code rm_ec;
            fs::remove(temp, rm_ec);
            return make_error_code(DiskErrc::write_error);
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(temp, rm_ec);
        return from_system_error(ec, DiskErrc::rename_error);
    }
    return {};
}

std::error_code FileBlobStore::remove(std::string_view key) {
    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec) {
        return from_system_error(ec, DiskErrc::remove_error);
    }
    return {};
}

bool FileBlobStore::contains(std::string_view key) const {
    std::error_code ec;
    return fs::exists(path_for(key), ec);
}

std::uint64_t FileBlobStore::byte_count() const {
    std::uint64_t total = 0;
    std::error_code ec;
    for (auto it = fs::directory_iterator(dir_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (is_temp_file(it->path())) continue;
        std::error_code size_ec;
        if (it->is_regular_file(size_ec)) {
            auto size = it->file_size(size_ec);
            if (!size_ec) total += size;
        }
    }
    return total;
}

std::error_code FileBlobStore::clear() {
    std::error_code ec;
    // Collect first; removing while iterating invalidates the iterator
    std::vector<fs::path> entries;
    for (auto it = fs::directory_iterator(dir_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(it->path());
    }
    for (const auto& path : entries) {
        std::error_code rm_ec;
        fs::remove_all(path, rm_ec);
        if (rm_ec) {
            return from_system_error(rm_ec, DiskErrc::remove_error);
        }
    }
    if (ec) {
        return from_system_error(ec, DiskErrc::read_error);
    }
    return {};
}

} // namespace spool::disk
