// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/incremental_writer.hpp>
#include <spool/core/byte_format.hpp>
#include <spool/core/error.hpp>
#include <spool/core/log.hpp>
#include <exception>

namespace spool::core {

IncrementalWriter::IncrementalWriter(std::int64_t start_offset,
                                     CachingConfig config,
                                     ChunkCommitFn commit) noexcept
    : start_offset_(start_offset)
    , config_(config)
    , commit_(std::move(commit)) {}

IncrementalWriter::~IncrementalWriter() {
    auto lock = std::lock_guard(mutex_);
    if (closed_) return;

    try {
        if (auto ec = flush_locked(true)) {
            logger()->error("session @ {}: {} unflushed on teardown: {}",
                            start_offset_, format_bytes(static_cast<std::int64_t>(buffer_.size() - last_flushed_)),
                            ec.message());
        }
    } catch (const std::exception& e) {
        logger()->error("session @ {}: teardown flush failed: {}", start_offset_, e.what());
    }
}

std::error_code IncrementalWriter::append(std::span<const std::byte> data) {
    auto lock = std::lock_guard(mutex_);

    if (closed_) {
        logger()->warn("session @ {}: dropping {} received after close",
                       start_offset_, format_bytes(static_cast<std::int64_t>(data.size())));
        return make_error_code(CacheErrc::session_closed);
    }
    if (data.empty()) return {};

    buffer_.insert(buffer_.end(), data.begin(), data.end());

    if (!config_.incremental()) return {};
    return flush_locked(false);
}

std::error_code IncrementalWriter::flush(bool force) {
    auto lock = std::lock_guard(mutex_);
    if (closed_) return make_error_code(CacheErrc::session_closed);
    return flush_locked(force);
}

std::error_code IncrementalWriter::cancel() {
    auto lock = std::lock_guard(mutex_);
    if (closed_) return {};

    logger()->debug("session @ {}: cancel with {} buffered", start_offset_,
                    format_bytes(static_cast<std::int64_t>(buffer_.size())));

    if (auto ec = flush_locked(true)) {
        return ec;
    }
    closed_ = true;
    return {};
}

std::error_code IncrementalWriter::finish(std::error_code transfer_error) {
    auto lock = std::lock_guard(mutex_);
    if (closed_) return {};

    if (transfer_error) {
        logger()->warn("session @ {}: transfer ended with error: {}", start_offset_,
                       transfer_error.message());
    }

    if (auto ec = flush_locked(true)) {
        return ec;
    }
    closed_ = true;
    return {};
}

std::error_code IncrementalWriter::flush_locked(bool force) {
    if (last_flushed_ > buffer_.size()) {
        logger()->error("session @ {}: flush cursor {} past buffer length {}, resetting",
                        start_offset_, last_flushed_, buffer_.size());
        last_flushed_ = buffer_.size();
        return make_error_code(CacheErrc::invariant_violation);
    }

    const std::size_t unflushed = buffer_.size() - last_flushed_;
    if (unflushed == 0) return {};

    if (!force && (!config_.incremental() || unflushed < config_.flush_threshold())) {
        return {};
    }

    const auto offset = start_offset_ + static_cast<std::int64_t>(last_flushed_);
    auto pending = std::span<const std::byte>(buffer_).subspan(last_flushed_);

    if (auto ec = commit_(offset, pending)) {
        // Cursor stays put; the next flush retries the same bytes
        return ec;
    }

    last_flushed_ = buffer_.size();
    ++flush_count_;

    logger()->debug("session @ {}: flushed {} at offset {} ({} total)", start_offset_,
                    format_bytes(static_cast<std::int64_t>(unflushed)), offset,
                    format_bytes(static_cast<std::int64_t>(last_flushed_)));
    return {};
}

std::uint64_t IncrementalWriter::buffered_bytes() const {
    auto lock = std::lock_guard(mutex_);
    return buffer_.size();
}

std::uint64_t IncrementalWriter::flushed_bytes() const {
    auto lock = std::lock_guard(mutex_);
    return last_flushed_;
}

std::uint32_t IncrementalWriter::flush_count() const {
    auto lock = std::lock_guard(mutex_);
    return flush_count_;
}

bool IncrementalWriter::is_closed() const {
    auto lock = std::lock_guard(mutex_);
    return closed_;
}

SessionSnapshot IncrementalWriter::snapshot() const {
    auto lock = std::lock_guard(mutex_);
    return {start_offset_, buffer_.size(), last_flushed_, flush_count_, closed_};
}

} // namespace spool::core
