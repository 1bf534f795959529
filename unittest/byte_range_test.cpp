#include <gtest/gtest.h>
#include "common/byte_range.hpp"
#include <stdexcept>
#include <vector>

namespace {
const uint64_t kMiB = 1024 * 1024;
}

TEST(ByteRangeTest, LengthIsInclusive) {
    EXPECT_EQ(ByteRange(0, 0).length(), 1u);
    EXPECT_EQ(ByteRange(512, 1023).length(), 512u);
    EXPECT_TRUE(ByteRange(0, 10).intersects(ByteRange(10, 20)));
    EXPECT_FALSE(ByteRange(0, 9).intersects(ByteRange(10, 20)));
}

TEST(ByteRangeTest, NormalizeCoalescesOverlappingAndAdjacent) {
    std::vector<ByteRange> result = ranges::normalize({{20, 29}, {0, 9}, {10, 15}, {25, 40}, {50, 60}});
    std::vector<ByteRange> expected = {{0, 15}, {20, 40}, {50, 60}};
    EXPECT_EQ(result, expected);
}

TEST(ByteRangeTest, SubtractSplitsPartiallyCoveredRange) {
    std::vector<ByteRange> result = ranges::subtract({{0, 99}}, {{10, 19}, {50, 59}});
    std::vector<ByteRange> expected = {{0, 9}, {20, 49}, {60, 99}};
    EXPECT_EQ(result, expected);
}

TEST(ByteRangeTest, SubtractRemovesFullyCoveredRanges) {
    std::vector<ByteRange> result = ranges::subtract({{0, 9}, {20, 29}, {40, 49}}, {{0, 25}, {45, 100}});
    std::vector<ByteRange> expected = {{26, 29}, {40, 44}};
    EXPECT_EQ(result, expected);
}

TEST(ByteRangeTest, SubtractWithEmptySkipReturnsInput) {
    std::vector<ByteRange> input = {{0, 9}, {20, 29}};
    EXPECT_EQ(ranges::subtract(input, {}), input);
}

TEST(ByteRangeTest, MergeJoinsRangesWithSmallGaps) {
    std::vector<ByteRange> result = ranges::mergeWithGap({{0, 99}, {150, 199}, {1000, 1099}}, 100, {});
    std::vector<ByteRange> expected = {{0, 199}, {1000, 1099}};
    EXPECT_EQ(result, expected);
}

TEST(ByteRangeTest, MergeDoesNotBridgeBarrier) {
    std::vector<ByteRange> result = ranges::mergeWithGap({{0, 99}, {150, 199}}, 100, {{110, 120}});
    std::vector<ByteRange> expected = {{0, 99}, {150, 199}};
    EXPECT_EQ(result, expected);
}

TEST(ByteRangeTest, SplitCutsAtAlignedBoundaries) {
    std::vector<ByteRange> result = ranges::splitAligned({{kMiB, 10 * kMiB - 1}}, 4 * kMiB);
    std::vector<ByteRange> expected = {{kMiB, 4 * kMiB - 1}, {4 * kMiB, 8 * kMiB - 1}, {8 * kMiB, 10 * kMiB - 1}};
    EXPECT_EQ(result, expected);
}

TEST(ByteRangeTest, SplitRejectsZeroChunk) {
    EXPECT_THROW(ranges::splitAligned({{0, 10}}, 0), std::invalid_argument);
}

TEST(ByteRangeTest, AlignWidensToPages) {
    std::vector<ByteRange> result = ranges::alignToPages({{100, 700}, {1024, 1024}}, 512);
    std::vector<ByteRange> expected = {{0, 1023}, {1024, 1535}};
    EXPECT_EQ(result, expected);
}

TEST(ByteRangeTest, ShrinkNarrowsToWholePages) {
    std::vector<ByteRange> result = ranges::shrinkToPages({{100, 2000}, {2048, 2100}, {4096, 4607}}, 512);
    std::vector<ByteRange> expected = {{512, 1535}, {4096, 4607}};
    EXPECT_EQ(result, expected);
}

TEST(ByteRangeTest, ClipAndTotalLength) {
    std::vector<ByteRange> clipped = ranges::clip({{0, 99}, {200, 299}, {400, 499}}, ByteRange(50, 249));
    std::vector<ByteRange> expected = {{50, 99}, {200, 249}};
    EXPECT_EQ(clipped, expected);
    EXPECT_EQ(ranges::totalLength(clipped), 100u);
}
