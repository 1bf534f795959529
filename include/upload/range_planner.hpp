#pragma once

#include "common/byte_range.hpp"
#include "common/parallel_task_manager.hpp"
#include "vhd/disk_stream.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct UploadPlan {
    std::vector<ByteRange> ranges;      // sorted, disjoint, page aligned, at most one page set each
    uint64_t alreadyProcessedBytes{0};  // stream bytes that need no transfer: skipped or never allocated
    uint64_t totalUploadableBytes{0};   // sum of the lengths in ranges
    uint64_t zeroBytesDropped{0};       // bytes of allocated ranges found to be all zero
};

/*
 * Turns the stream's allocated ranges into page-aligned transfer units of at
 * most one page set. Ranges already present remotely are skipped; a page only
 * partly covered by a skip range is sent again in full.
 */
class RangePlanner {
public:
    static constexpr uint64_t kDefaultPageSize = 512;
    static constexpr uint64_t kDefaultPageSetSize = 4 * 1024 * 1024;
    static constexpr uint64_t kMaxPageSetSize = 4 * 1024 * 1024;  // largest single Put Page body

    // Empty when the geometry is usable. The page size must divide the 512-byte
    // footer so the stream, and with it the blob, stays a whole number of pages.
    static std::string checkGeometry(uint64_t pageSize, uint64_t pageSetSize);

    // Throws std::invalid_argument when checkGeometry() reports a problem
    RangePlanner(uint64_t pageSize = kDefaultPageSize, uint64_t pageSetSize = kDefaultPageSetSize);

    UploadPlan locateUploadableRanges(const vhd::VirtualDiskStream& stream,
                                      const std::vector<ByteRange>& skipRanges) const;

    // Reads every range and drops those holding only zero bytes; partly zero ranges stay whole
    std::vector<ByteRange> detectEmptyRanges(const vhd::VirtualDiskStream& stream,
                                             const std::vector<ByteRange>& ranges,
                                             ParallelTaskManager& taskManager) const;

    // Same, updating the plan's totals
    void detectEmptyRanges(const vhd::VirtualDiskStream& stream, UploadPlan& plan,
                           ParallelTaskManager& taskManager) const;

    uint64_t pageSize() const { return pageSize_; }
    uint64_t pageSetSize() const { return pageSetSize_; }

private:
    uint64_t pageSize_;
    uint64_t pageSetSize_;
};
