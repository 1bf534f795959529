#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Inclusive [start, end] span of byte offsets
struct ByteRange {
    uint64_t start{0};
    uint64_t end{0};

    ByteRange() = default;
    ByteRange(uint64_t s, uint64_t e) : start(s), end(e) {}

    uint64_t length() const { return end - start + 1; }
    bool intersects(const ByteRange& other) const {
        return start <= other.end && other.start <= end;
    }
    bool contains(uint64_t offset) const { return offset >= start && offset <= end; }
    std::string toString() const;

    bool operator==(const ByteRange& rhs) const { return start == rhs.start && end == rhs.end; }
    bool operator!=(const ByteRange& rhs) const { return !(*this == rhs); }
    bool operator<(const ByteRange& rhs) const {
        return start < rhs.start || (start == rhs.start && end < rhs.end);
    }
};

namespace ranges {

// Sorts and coalesces overlapping or adjacent ranges
std::vector<ByteRange> normalize(std::vector<ByteRange> ranges);

// Removes every byte covered by `skip` from `from`; splits partially covered ranges
std::vector<ByteRange> subtract(const std::vector<ByteRange>& from, const std::vector<ByteRange>& skip);

// Joins neighbours separated by fewer than `maxGap` bytes, unless the gap touches `barriers`
std::vector<ByteRange> mergeWithGap(const std::vector<ByteRange>& sorted, uint64_t maxGap,
                                    const std::vector<ByteRange>& barriers);

// Cuts ranges at every multiple of `chunkSize`
std::vector<ByteRange> splitAligned(const std::vector<ByteRange>& sorted, uint64_t chunkSize);

// Widens every range outward to `pageSize` boundaries
std::vector<ByteRange> alignToPages(const std::vector<ByteRange>& sorted, uint64_t pageSize);

// Narrows every range inward to `pageSize` boundaries; ranges smaller than a page vanish
std::vector<ByteRange> shrinkToPages(const std::vector<ByteRange>& sorted, uint64_t pageSize);

// Keeps the part of every range that lies inside `window`
std::vector<ByteRange> clip(const std::vector<ByteRange>& sorted, const ByteRange& window);

uint64_t totalLength(const std::vector<ByteRange>& ranges);

} // namespace ranges
