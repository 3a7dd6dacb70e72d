// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/config.hpp>
#include <spool/disk/blob_store.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <span>
#include <system_error>

namespace spool::core {

using disk::Bytes;

// Persists one chunk at an absolute offset; supplied by the coordinator
using ChunkCommitFn = std::function<std::error_code(std::int64_t offset,
                                                    std::span<const std::byte> data)>;

// Consistent view of a session's progress
struct SessionSnapshot {
    std::int64_t start_offset{0};
    std::uint64_t buffered_bytes{0};
    std::uint64_t flushed_bytes{0};
    std::uint32_t flush_count{0};
    bool closed{false};
};

// Buffers the bytes of one in-flight range write and persists them every
// `flush_threshold` bytes, so that an abnormal exit loses at most one
// threshold's worth of data.
//
// Every operation runs under the session mutex, including the commit of a
// flush, so the flush cursor can never run past the buffer and only moves
// once the chunk is durable.
class IncrementalWriter {
public:
    IncrementalWriter(std::int64_t start_offset, CachingConfig config, ChunkCommitFn commit) noexcept;

    // Force-flushes anything left if neither finish() nor cancel() succeeded
    ~IncrementalWriter();

    IncrementalWriter(const IncrementalWriter&) = delete;
    IncrementalWriter& operator=(const IncrementalWriter&) = delete;
    IncrementalWriter(IncrementalWriter&&) = delete;
    IncrementalWriter& operator=(IncrementalWriter&&) = delete;

    // Downloader delivered more bytes (sequential within the session)
    [[nodiscard]] std::error_code append(std::span<const std::byte> data);

    // Persist the unflushed suffix if forced or at least one threshold long
    [[nodiscard]] std::error_code flush(bool force);

    // Transfer aborted: flush everything, then close
    [[nodiscard]] std::error_code cancel();

    // Transfer ended: flush the remainder, then close. A transfer error is
    // logged; the bytes received before it are still kept.
    [[nodiscard]] std::error_code finish(std::error_code transfer_error = {});

    [[nodiscard]] std::int64_t start_offset() const noexcept { return start_offset_; }
    [[nodiscard]] const CachingConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::uint64_t buffered_bytes() const;
    [[nodiscard]] std::uint64_t flushed_bytes() const;
    [[nodiscard]] std::uint32_t flush_count() const;
    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] SessionSnapshot snapshot() const;

private:
    [[nodiscard]] std::error_code flush_locked(bool force);

    const std::int64_t start_offset_;
    const CachingConfig config_;
    ChunkCommitFn commit_;

    Bytes buffer_;
    std::size_t last_flushed_{0};
    std::uint32_t flush_count_{0};
    bool closed_{false};
    mutable std::mutex mutex_;
};

} // namespace spool::core
