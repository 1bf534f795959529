#include <gtest/gtest.h>
#include "common/upload_error.hpp"
#include "common/utils.hpp"
#include "vhd/disk_stream.hpp"
#include "vhd_test_image.hpp"
#include <endian.h>
#include <cstring>

using testimage::kMiB;

class DiskStreamTest : public ::testing::Test {
protected:
    std::unique_ptr<vhd::VirtualDiskStream> openStream(const std::string& name) {
        return vhd::VirtualDiskStream::open(dir_.file(name));
    }

    testimage::TempDir dir_;
};

TEST_F(DiskStreamTest, FixedStreamMatchesFile) {
    std::vector<uint8_t> data = testimage::pattern(3 * kMiB, 5);
    testimage::writeFixed(dir_.file("fixed.vhd"), data);
    auto stream = openStream("fixed.vhd");

    EXPECT_EQ(stream->size(), 3 * kMiB + 512);
    EXPECT_EQ(stream->virtualSize(), 3 * kMiB);
    EXPECT_EQ(stream->allocationUnit(), vhd::VirtualDiskStream::kFixedAllocationUnit);
    EXPECT_EQ(stream->unitCount(), 2u);
    EXPECT_EQ(stream->readAt(0, static_cast<size_t>(stream->size())), testimage::readBytes(dir_.file("fixed.vhd")));
}

TEST_F(DiskStreamTest, FixedStreamReportsOneRangeWithFooter) {
    testimage::writeFixed(dir_.file("fixed.vhd"), testimage::pattern(5 * kMiB, 5));
    auto stream = openStream("fixed.vhd");

    std::vector<ByteRange> expected{{0, 5 * kMiB + 511}};
    EXPECT_EQ(stream->allocatedRanges(), expected);
}

TEST_F(DiskStreamTest, DynamicUnallocatedRegionsReadAsZero) {
    testimage::DynamicImage image(8 * kMiB, 2 * kMiB);
    std::vector<uint8_t> data = testimage::pattern(4096, 6);
    image.write(2 * kMiB + 4096, data);
    image.save(dir_.file("dynamic.vhd"));
    auto stream = openStream("dynamic.vhd");

    EXPECT_EQ(stream->readAt(2 * kMiB + 4096, data.size()), data);
    EXPECT_EQ(stream->readAt(0, 4096), std::vector<uint8_t>(4096, 0));
    // Sectors of an allocated block that the bitmap does not mark
    EXPECT_EQ(stream->readAt(2 * kMiB, 4096), std::vector<uint8_t>(4096, 0));

    std::vector<uint8_t> spanning = stream->readAt(2 * kMiB + 4096 - 512, 1024);
    EXPECT_EQ(std::vector<uint8_t>(spanning.begin(), spanning.begin() + 512), std::vector<uint8_t>(512, 0));
    EXPECT_EQ(std::vector<uint8_t>(spanning.begin() + 512, spanning.end()),
              std::vector<uint8_t>(data.begin(), data.begin() + 512));
}

TEST_F(DiskStreamTest, DynamicRangesFollowAllocatedBlocks) {
    testimage::DynamicImage image(8 * kMiB, 2 * kMiB);
    image.write(2 * kMiB, testimage::pattern(512, 1));
    image.allocateBlock(3);
    image.save(dir_.file("dynamic.vhd"));
    auto stream = openStream("dynamic.vhd");

    EXPECT_EQ(stream->allocationUnit(), 2 * kMiB);
    EXPECT_FALSE(stream->isUnitAllocated(0));
    EXPECT_TRUE(stream->isUnitAllocated(1));
    EXPECT_TRUE(stream->isUnitAllocated(3));

    std::vector<ByteRange> expected{{2 * kMiB, 4 * kMiB - 1}, {6 * kMiB, 8 * kMiB + 511}};
    EXPECT_EQ(stream->allocatedRanges(), expected);
}

TEST_F(DiskStreamTest, FooterReportedAloneWhenLastBlockIsFree) {
    testimage::DynamicImage image(8 * kMiB, 2 * kMiB);
    image.write(0, testimage::pattern(512, 1));
    image.save(dir_.file("dynamic.vhd"));
    auto stream = openStream("dynamic.vhd");

    std::vector<ByteRange> expected{{0, 2 * kMiB - 1}, {8 * kMiB, 8 * kMiB + 511}};
    EXPECT_EQ(stream->allocatedRanges(), expected);
}

TEST_F(DiskStreamTest, EnumeratorRestartsAfterReset) {
    testimage::DynamicImage image(8 * kMiB, 2 * kMiB);
    image.write(4 * kMiB, testimage::pattern(512, 1));
    image.save(dir_.file("dynamic.vhd"));
    auto stream = openStream("dynamic.vhd");

    vhd::AllocatedRangeEnumerator it = stream->enumerateAllocatedRanges();
    ByteRange range;
    ASSERT_TRUE(it.next(range));
    EXPECT_EQ(range, ByteRange(4 * kMiB, 6 * kMiB - 1));
    ASSERT_TRUE(it.next(range));
    EXPECT_EQ(range, stream->footerRange());
    EXPECT_FALSE(it.next(range));
    EXPECT_FALSE(it.next(range));

    it.reset();
    ASSERT_TRUE(it.next(range));
    EXPECT_EQ(range, ByteRange(4 * kMiB, 6 * kMiB - 1));
}

TEST_F(DiskStreamTest, DifferencingReadsFallBackToParent) {
    std::vector<uint8_t> parentData = testimage::pattern(2048, 1);
    std::vector<uint8_t> childData = testimage::pattern(512, 2);

    testimage::DynamicImage parent(8 * kMiB, 2 * kMiB, 10);
    parent.write(0, parentData);
    parent.save(dir_.file("base.vhd"));

    testimage::DynamicImage child(8 * kMiB, 2 * kMiB, 20);
    child.write(512, childData);
    child.write(6 * kMiB, childData);
    child.setParent("base.vhd", 10);
    child.save(dir_.file("child.vhd"));

    auto stream = openStream("child.vhd");
    std::vector<uint8_t> head = stream->readAt(0, 2048);

    std::vector<uint8_t> expected(parentData);
    std::copy(childData.begin(), childData.end(), expected.begin() + 512);
    EXPECT_EQ(head, expected);
    EXPECT_EQ(stream->readAt(6 * kMiB, 512), childData);
    EXPECT_EQ(stream->readAt(4 * kMiB, 512), std::vector<uint8_t>(512, 0));

    std::vector<ByteRange> ranges{{0, 2 * kMiB - 1}, {6 * kMiB, 8 * kMiB + 511}};
    EXPECT_EQ(stream->allocatedRanges(), ranges);
}

TEST_F(DiskStreamTest, ChildSectorHidesParentSector) {
    testimage::DynamicImage parent(2 * kMiB, 2 * kMiB, 10);
    parent.write(0, testimage::pattern(512, 1));
    parent.save(dir_.file("base.vhd"));

    // Present in the child and zero filled, so the parent's bytes must not show through
    testimage::DynamicImage child(2 * kMiB, 2 * kMiB, 20);
    child.markPresent(0, 512);
    child.setParent("base.vhd", 10);
    child.save(dir_.file("child.vhd"));

    auto stream = openStream("child.vhd");
    EXPECT_EQ(stream->readAt(0, 512), std::vector<uint8_t>(512, 0));
}

TEST_F(DiskStreamTest, ReadPastEndThrows) {
    testimage::writeFixed(dir_.file("fixed.vhd"), std::vector<uint8_t>(kMiB, 1));
    auto stream = openStream("fixed.vhd");

    EXPECT_NO_THROW(stream->readAt(stream->size() - 1, 1));
    EXPECT_NO_THROW(stream->readAt(stream->size(), 0));
    EXPECT_THROW(stream->readAt(stream->size() - 1, 2), OutOfRangeError);
    EXPECT_THROW(stream->readAt(stream->size() + 1, 0), OutOfRangeError);
}

TEST_F(DiskStreamTest, FooterBytesDescribeFixedDisk) {
    testimage::DynamicImage image(4 * kMiB, 2 * kMiB);
    image.save(dir_.file("dynamic.vhd"));
    auto stream = openStream("dynamic.vhd");

    std::vector<uint8_t> tail = stream->readAt(4 * kMiB, 512);
    EXPECT_EQ(tail, stream->footerBytes());

    vhd::Footer footer;
    std::memcpy(&footer, tail.data(), sizeof(footer));
    uint32_t stored = be32toh(footer.checksum);
    footer.checksum = 0;
    EXPECT_EQ(stored, vhd::checksum(&footer, sizeof(footer)));
    EXPECT_EQ(be32toh(footer.diskType), static_cast<uint32_t>(vhd::DiskType::Fixed));

    // The stream reopens as a Fixed VHD
    testimage::writeBytes(dir_.file("flat.vhd"), stream->readAt(0, static_cast<size_t>(stream->size())));
    auto flat = vhd::VhdFile::open(dir_.file("flat.vhd"));
    EXPECT_EQ(flat->diskType(), vhd::DiskType::Fixed);
    EXPECT_EQ(flat->virtualSize(), 4 * kMiB);
}

TEST_F(DiskStreamTest, ContentMd5CoversWholeStream) {
    testimage::DynamicImage image(6 * kMiB, 2 * kMiB);
    image.write(2 * kMiB + 512, testimage::pattern(8192, 3));
    image.save(dir_.file("dynamic.vhd"));
    auto stream = openStream("dynamic.vhd");

    std::vector<uint8_t> all = stream->readAt(0, static_cast<size_t>(stream->size()));
    utils::Md5Digest digest;
    digest.update(all.data(), all.size());

    EXPECT_EQ(stream->contentMd5(), digest.finish());
}
