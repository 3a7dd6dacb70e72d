// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace spool::core {

// Contiguous [offset, offset + length) span of cached bytes
struct CachedRange {
    std::int64_t offset{0};
    std::int64_t length{0};

    [[nodiscard]] constexpr std::int64_t end() const noexcept { return offset + length; }

    [[nodiscard]] constexpr bool contains(std::int64_t off, std::int64_t len) const noexcept {
        return off >= offset && off + len <= end();
    }

    bool operator==(const CachedRange&) const = default;
};

// Sorted set of disjoint, non-adjacent ranges. Every insert merges
// immediately, so the set is always fully coalesced.
class RangeIndex {
public:
    RangeIndex() = default;

    // Normalises an arbitrary list; invalid entries are dropped
    explicit RangeIndex(std::span<const CachedRange> ranges);

    // Insert and merge with every overlapping or touching range.
    // Returns invalid_range for length <= 0, offset < 0 or overflow.
    [[nodiscard]] std::error_code add_range(std::int64_t offset, std::int64_t length);

    // True iff one range fully contains [offset, offset + length)
    [[nodiscard]] bool is_covered(std::int64_t offset, std::int64_t length) const noexcept;

    // Uncovered sub-intervals of the window, ascending
    [[nodiscard]] std::vector<CachedRange> gaps(std::int64_t offset, std::int64_t length) const;

    [[nodiscard]] const std::vector<CachedRange>& ranges() const noexcept { return ranges_; }
    [[nodiscard]] std::int64_t total_bytes() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return ranges_.size(); }
    [[nodiscard]] bool empty() const noexcept { return ranges_.empty(); }
    void clear() noexcept { ranges_.clear(); }

    bool operator==(const RangeIndex&) const = default;

private:
    std::vector<CachedRange> ranges_;
};

} // namespace spool::core
