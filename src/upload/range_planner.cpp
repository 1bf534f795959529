#include "upload/range_planner.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>

namespace {

bool isAllZero(const std::vector<uint8_t>& data) {
    return std::all_of(data.begin(), data.end(), [](uint8_t b) { return b == 0; });
}

std::string describe(const std::vector<ByteRange>& list) {
    return std::to_string(list.size()) + " range(s), " + std::to_string(ranges::totalLength(list)) + " bytes";
}

} // namespace

std::string RangePlanner::checkGeometry(uint64_t pageSize, uint64_t pageSetSize) {
    if (pageSize == 0 || vhd::kFooterSize % pageSize != 0) {
        return "Page size " + std::to_string(pageSize) + " must divide the " + std::to_string(vhd::kFooterSize) +
               "-byte footer";
    }
    if (pageSetSize == 0 || pageSetSize % pageSize != 0) {
        return "Page set size " + std::to_string(pageSetSize) + " must be a positive multiple of page size " +
               std::to_string(pageSize);
    }
    if (pageSetSize > kMaxPageSetSize) {
        return "Page set size " + std::to_string(pageSetSize) + " exceeds the " + std::to_string(kMaxPageSetSize) +
               "-byte write limit";
    }
    return "";
}

RangePlanner::RangePlanner(uint64_t pageSize, uint64_t pageSetSize)
    : pageSize_(pageSize)
    , pageSetSize_(pageSetSize) {
    std::string problem = checkGeometry(pageSize_, pageSetSize_);
    if (!problem.empty()) {
        throw std::invalid_argument(problem);
    }
}

UploadPlan RangePlanner::locateUploadableRanges(const vhd::VirtualDiskStream& stream,
                                                const std::vector<ByteRange>& skipRanges) const {
    std::vector<ByteRange> candidates = ranges::normalize(stream.allocatedRanges());

    // Only whole pages count as present remotely
    std::vector<ByteRange> skip = ranges::shrinkToPages(ranges::normalize(skipRanges), pageSize_);

    Logger::debug("Allocated candidates: " + describe(candidates) + "; skip set: " + describe(skip));

    std::vector<ByteRange> data;
    if (stream.virtualSize() > 0) {
        data = ranges::clip(candidates, ByteRange(0, stream.virtualSize() - 1));
    }
    data = ranges::subtract(data, skip);
    data = ranges::mergeWithGap(data, pageSetSize_, skip);
    data = ranges::splitAligned(data, pageSetSize_);
    data = ranges::alignToPages(data, pageSize_);

    // The footer is its own transfer unit so the disk content keeps page-set alignment
    std::vector<ByteRange> footer = ranges::clip(candidates, stream.footerRange());
    footer = ranges::subtract(footer, skip);
    footer = ranges::alignToPages(footer, pageSize_);
    footer = ranges::clip(footer, ByteRange(0, stream.size() - 1));

    UploadPlan plan;
    plan.ranges = data;
    for (const auto& r : footer) {
        if (plan.ranges.empty() || r.start > plan.ranges.back().end) {
            plan.ranges.push_back(r);
        } else if (r.end > plan.ranges.back().end) {
            plan.ranges.emplace_back(plan.ranges.back().end + 1, r.end);
        }
    }

    plan.totalUploadableBytes = ranges::totalLength(plan.ranges);
    plan.alreadyProcessedBytes = stream.size() - plan.totalUploadableBytes;

    Logger::info("Upload plan: " + describe(plan.ranges) + ", " + std::to_string(plan.alreadyProcessedBytes) +
                 " bytes need no transfer");
    return plan;
}

std::vector<ByteRange> RangePlanner::detectEmptyRanges(const vhd::VirtualDiskStream& stream,
                                                       const std::vector<ByteRange>& ranges,
                                                       ParallelTaskManager& taskManager) const {
    std::vector<std::future<bool>> results;
    results.reserve(ranges.size());
    for (const auto& range : ranges) {
        const vhd::VirtualDiskStream* source = &stream;
        results.push_back(taskManager.addTask([source, range]() {
            return !isAllZero(source->readAt(range.start, static_cast<size_t>(range.length())));
        }));
    }

    // Every future is drained before the first failure is rethrown
    std::vector<ByteRange> kept;
    std::exception_ptr failure;
    for (size_t i = 0; i < results.size(); ++i) {
        try {
            if (results[i].get()) {
                kept.push_back(ranges[i]);
            }
        } catch (const std::exception&) {
            if (!failure) {
                failure = std::current_exception();
            }
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    Logger::debug("Zero scan kept " + describe(kept) + " of " + describe(ranges));
    return kept;
}

void RangePlanner::detectEmptyRanges(const vhd::VirtualDiskStream& stream, UploadPlan& plan,
                                     ParallelTaskManager& taskManager) const {
    std::vector<ByteRange> kept = detectEmptyRanges(stream, plan.ranges, taskManager);
    uint64_t keptBytes = ranges::totalLength(kept);

    plan.zeroBytesDropped += plan.totalUploadableBytes - keptBytes;
    plan.totalUploadableBytes = keptBytes;
    plan.ranges = std::move(kept);

    Logger::info("After zero detection: " + describe(plan.ranges) + ", " + std::to_string(plan.zeroBytesDropped) +
                 " zero bytes dropped");
}
