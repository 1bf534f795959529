#pragma once

#include "vhd/vhd_format.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vhd {

// Maximum number of differencing links followed before the chain is rejected
const int kMaxParentDepth = 32;

using SectorBitmap = std::vector<uint8_t>;

/*
 * Read-only decoder for one VHD file: footer, dynamic header, block allocation
 * table and per-block sector bitmaps. A differencing file owns its parent, so
 * the whole chain lives and dies with the topmost VhdFile.
 *
 * Reads use pread(2) on a single descriptor and never move a shared file
 * position, so every const method may be called from many threads at once.
 */
class VhdFile {
public:
    // Opens the file and, for differencing disks, every ancestor. Throws FormatError.
    static std::unique_ptr<VhdFile> open(const std::string& path, int maxParentDepth = kMaxParentDepth);

    ~VhdFile();

    VhdFile(const VhdFile&) = delete;
    VhdFile& operator=(const VhdFile&) = delete;

    const std::string& path() const { return path_; }
    DiskType diskType() const { return static_cast<DiskType>(footer_.diskType); }
    bool isExpandable() const { return diskType() != DiskType::Fixed; }
    uint64_t virtualSize() const { return footer_.currentSize; }
    uint64_t fileSize() const { return fileSize_; }
    uint32_t timestamp() const { return footer_.timestamp; }
    const Footer& footer() const { return footer_; }
    const Header& header() const { return header_; }

    uint32_t blockSize() const { return header_.blockSize; }
    uint32_t sectorsPerBlock() const { return header_.blockSize / kSectorSize; }
    uint32_t blockCount() const { return static_cast<uint32_t>(bat_.size()); }
    uint32_t bitmapSize() const { return bitmapSize_; }
    uint32_t allocatedBlockCount() const;

    // Parent of a differencing disk, nullptr otherwise
    const VhdFile* parent() const { return parent_.get(); }
    const std::string& parentPath() const { return parentPath_; }
    std::string uniqueIdString() const;

    bool isBlockAllocated(uint32_t block) const;

    // Absolute file offset of the first data sector of an allocated block
    uint64_t blockDataOffset(uint32_t block) const;

    // Sector presence bitmap of an allocated block, cached after the first read
    std::shared_ptr<const SectorBitmap> blockBitmap(uint32_t block) const;

    static bool isSectorPresent(const SectorBitmap& bitmap, uint32_t sectorInBlock) {
        return (bitmap[sectorInBlock >> 3] & (0x80 >> (sectorInBlock & 7))) != 0;
    }

    // True when this layer itself holds data for the virtual sector
    bool hasSector(uint64_t sector) const;

    // Copies sectors this layer holds; the caller checked hasSector() for every one of them
    void readVirtual(uint64_t offset, uint8_t* buf, size_t len) const;

    // Raw positioned read from the file
    void readPhysical(uint64_t offset, uint8_t* buf, size_t len) const;

    // Footer describing this disk as a Fixed VHD, in on-disk byte order
    Footer fixedFooter() const;

private:
    VhdFile(const std::string& path, int fd);

    static std::unique_ptr<VhdFile> openSingle(const std::string& path);

    void readFooter();
    void readHeader();
    void readAllocationTable();
    std::string resolveParentPath() const;

    const size_t kMaxCachedBitmaps = 4096;

    std::string path_;
    int fd_;
    uint64_t fileSize_;

    Footer footer_;
    Header header_;
    std::vector<uint32_t> bat_;
    uint32_t bitmapSize_;

    std::string parentPath_;
    std::unique_ptr<VhdFile> parent_;

    mutable std::mutex bitmapMutex_;
    mutable std::unordered_map<uint32_t, std::shared_ptr<const SectorBitmap>> bitmapCache_;
};

} // namespace vhd
