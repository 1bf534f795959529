#pragma once

#include "common/byte_range.hpp"
#include "vhd/vhd_file.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vhd {

class VirtualDiskStream;

/*
 * Walks the stream's allocation units and yields one ByteRange per maximal
 * run of units that hold data in any layer of the differencing chain. The
 * trailing footer is always reported, merged into the last run when that run
 * reaches the end of the virtual disk. Call reset() to start over.
 */
class AllocatedRangeEnumerator {
public:
    explicit AllocatedRangeEnumerator(const VirtualDiskStream& stream);

    bool next(ByteRange& range);
    void reset();

private:
    const VirtualDiskStream& stream_;
    uint64_t nextUnit_;
    bool footerReported_;
};

/*
 * The disk seen as one Fixed VHD image: virtualSize() bytes of disk content
 * followed by a 512-byte Fixed footer. Sectors missing from every layer of a
 * differencing chain read as zero. All read methods are safe to call
 * concurrently.
 */
class VirtualDiskStream {
public:
    // Allocation unit used for Fixed sources, which have no block table
    static constexpr uint64_t kFixedAllocationUnit = 2 * 1024 * 1024;

    static std::unique_ptr<VirtualDiskStream> open(const std::string& path);

    explicit VirtualDiskStream(std::unique_ptr<VhdFile> file);

    uint64_t size() const { return file_->virtualSize() + kFooterSize; }
    uint64_t virtualSize() const { return file_->virtualSize(); }
    DiskType diskType() const { return file_->diskType(); }
    const VhdFile& file() const { return *file_; }

    uint64_t allocationUnit() const { return unit_; }
    uint64_t unitCount() const;
    bool isUnitAllocated(uint64_t unit) const;

    ByteRange footerRange() const { return ByteRange(virtualSize(), size() - 1); }
    const std::vector<uint8_t>& footerBytes() const { return footerBytes_; }

    // Throws OutOfRangeError when offset + len exceeds size()
    void readAt(uint64_t offset, uint8_t* buf, size_t len) const;
    std::vector<uint8_t> readAt(uint64_t offset, size_t len) const;

    AllocatedRangeEnumerator enumerateAllocatedRanges() const;
    std::vector<ByteRange> allocatedRanges() const;

    // MD5 over the full stream; unallocated units are hashed as zeros without being read
    std::vector<uint8_t> contentMd5() const;

private:
    void readDisk(uint64_t offset, uint8_t* buf, size_t len) const;

    std::unique_ptr<VhdFile> file_;
    std::vector<const VhdFile*> chain_;
    uint64_t unit_;
    std::vector<uint8_t> footerBytes_;
};

} // namespace vhd
