#include "common/byte_range.hpp"
#include <algorithm>
#include <stdexcept>

std::string ByteRange::toString() const {
    return "[" + std::to_string(start) + ", " + std::to_string(end) + "]";
}

namespace ranges {

std::vector<ByteRange> normalize(std::vector<ByteRange> ranges) {
    std::sort(ranges.begin(), ranges.end());

    std::vector<ByteRange> result;
    for (const auto& r : ranges) {
        if (!result.empty() && r.start <= result.back().end + 1) {
            result.back().end = std::max(result.back().end, r.end);
        } else {
            result.push_back(r);
        }
    }
    return result;
}

std::vector<ByteRange> subtract(const std::vector<ByteRange>& from, const std::vector<ByteRange>& skip) {
    std::vector<ByteRange> source = normalize(from);
    std::vector<ByteRange> holes = normalize(skip);

    std::vector<ByteRange> result;
    size_t h = 0;
    for (const auto& r : source) {
        uint64_t cursor = r.start;
        bool exhausted = false;

        // Holes ending before this range cannot affect it or any later one
        while (h < holes.size() && holes[h].end < r.start) {
            ++h;
        }

        for (size_t i = h; i < holes.size() && holes[i].start <= r.end; ++i) {
            if (holes[i].start > cursor) {
                result.emplace_back(cursor, holes[i].start - 1);
            }
            if (holes[i].end >= r.end) {
                exhausted = true;
                break;
            }
            cursor = std::max(cursor, holes[i].end + 1);
        }

        if (!exhausted) {
            result.emplace_back(cursor, r.end);
        }
    }
    return result;
}

std::vector<ByteRange> mergeWithGap(const std::vector<ByteRange>& sorted, uint64_t maxGap,
                                    const std::vector<ByteRange>& barriers) {
    std::vector<ByteRange> walls = normalize(barriers);

    auto gapBlocked = [&walls](uint64_t gapStart, uint64_t gapEnd) {
        ByteRange gap(gapStart, gapEnd);
        auto it = std::lower_bound(walls.begin(), walls.end(), gap,
                                   [](const ByteRange& w, const ByteRange& g) { return w.end < g.start; });
        return it != walls.end() && it->intersects(gap);
    };

    std::vector<ByteRange> result;
    for (const auto& r : sorted) {
        if (!result.empty()) {
            ByteRange& last = result.back();
            if (r.start <= last.end + 1) {
                last.end = std::max(last.end, r.end);
                continue;
            }
            uint64_t gap = r.start - last.end - 1;
            if (gap < maxGap && !gapBlocked(last.end + 1, r.start - 1)) {
                last.end = r.end;
                continue;
            }
        }
        result.push_back(r);
    }
    return result;
}

std::vector<ByteRange> splitAligned(const std::vector<ByteRange>& sorted, uint64_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }

    std::vector<ByteRange> result;
    for (const auto& r : sorted) {
        uint64_t start = r.start;
        while (start <= r.end) {
            uint64_t boundary = (start / chunkSize + 1) * chunkSize;
            uint64_t end = std::min(r.end, boundary - 1);
            result.emplace_back(start, end);
            if (end == r.end) {
                break;
            }
            start = end + 1;
        }
    }
    return result;
}

std::vector<ByteRange> alignToPages(const std::vector<ByteRange>& sorted, uint64_t pageSize) {
    if (pageSize == 0) {
        throw std::invalid_argument("page size must be positive");
    }

    std::vector<ByteRange> result;
    result.reserve(sorted.size());
    for (const auto& r : sorted) {
        uint64_t start = (r.start / pageSize) * pageSize;
        uint64_t end = (r.end / pageSize + 1) * pageSize - 1;
        result.emplace_back(start, end);
    }
    return result;
}

std::vector<ByteRange> shrinkToPages(const std::vector<ByteRange>& sorted, uint64_t pageSize) {
    if (pageSize == 0) {
        throw std::invalid_argument("page size must be positive");
    }

    std::vector<ByteRange> result;
    for (const auto& r : sorted) {
        uint64_t start = ((r.start + pageSize - 1) / pageSize) * pageSize;
        uint64_t endExclusive = ((r.end + 1) / pageSize) * pageSize;
        if (endExclusive > start) {
            result.emplace_back(start, endExclusive - 1);
        }
    }
    return result;
}

std::vector<ByteRange> clip(const std::vector<ByteRange>& sorted, const ByteRange& window) {
    std::vector<ByteRange> result;
    for (const auto& r : sorted) {
        if (!r.intersects(window)) {
            continue;
        }
        result.emplace_back(std::max(r.start, window.start), std::min(r.end, window.end));
    }
    return result;
}

uint64_t totalLength(const std::vector<ByteRange>& ranges) {
    uint64_t total = 0;
    for (const auto& r : ranges) {
        total += r.length();
    }
    return total;
}

} // namespace ranges
