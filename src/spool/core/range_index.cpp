// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/range_index.hpp>
#include <spool/core/error.hpp>
#include <algorithm>
#include <limits>

namespace spool::core {

RangeIndex::RangeIndex(std::span<const CachedRange> ranges) {
    for (const auto& r : ranges) {
        (void)add_range(r.offset, r.length);
    }
}

std::error_code RangeIndex::add_range(std::int64_t offset, std::int64_t length) {
    if (offset < 0 || length <= 0 ||
        length > std::numeric_limits<std::int64_t>::max() - offset) {
        return make_error_code(CacheErrc::invalid_range);
    }

    std::int64_t start = offset;
    std::int64_t end = offset + length;

    // First range that could touch the new one: the predecessor if it
    // reaches start, otherwise the first range starting after start
    auto first = std::upper_bound(ranges_.begin(), ranges_.end(), start,
        [](std::int64_t value, const CachedRange& r) { return value < r.offset; });
    if (first != ranges_.begin() && std::prev(first)->end() >= start) {
        --first;
    }

    auto last = first;
    while (last != ranges_.end() && last->offset <= end) {
        start = std::min(start, last->offset);
        end = std::max(end, last->end());
        ++last;
    }

    auto pos = ranges_.erase(first, last);
    ranges_.insert(pos, CachedRange{start, end - start});
    return {};
}

bool RangeIndex::is_covered(std::int64_t offset, std::int64_t length) const noexcept {
    if (offset < 0 || length <= 0) return false;

    auto it = std::upper_bound(ranges_.begin(), ranges_.end(), offset,
        [](std::int64_t value, const CachedRange& r) { return value < r.offset; });
    if (it == ranges_.begin()) return false;
    return std::prev(it)->contains(offset, length);
}

std::vector<CachedRange> RangeIndex::gaps(std::int64_t offset, std::int64_t length) const {
    std::vector<CachedRange> result;
    if (offset < 0 || length <= 0) return result;

    const std::int64_t window_end = offset + length;
    std::int64_t cursor = offset;

    for (const auto& r : ranges_) {
        if (r.end() <= cursor) continue;
        if (r.offset >= window_end) break;
        if (r.offset > cursor) {
            result.push_back({cursor, r.offset - cursor});
        }
        cursor = std::max(cursor, r.end());
        if (cursor >= window_end) break;
    }

    if (cursor < window_end) {
        result.push_back({cursor, window_end - cursor});
    }
    return result;
}

std::int64_t RangeIndex::total_bytes() const noexcept {
    std::int64_t total = 0;
    for (const auto& r : ranges_) {
        total += r.length;
    }
    return total;
}

} // namespace spool::core
