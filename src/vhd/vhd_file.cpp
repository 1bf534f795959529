#include "vhd/vhd_file.hpp"
#include "common/logger.hpp"
#include "common/upload_error.hpp"
#include <endian.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace vhd {

namespace {

bool isPowerOfTwo(uint32_t v) {
    return v != 0 && (v & (v - 1)) == 0;
}

std::string hexString(const uint8_t* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

// Windows locators use backslashes and may carry a drive letter
std::string normalizeLocatorPath(std::string p) {
    std::replace(p.begin(), p.end(), '\\', '/');
    if (p.size() >= 2 && p[1] == ':') {
        p = p.substr(2);
    }
    return p;
}

} // namespace

VhdFile::VhdFile(const std::string& path, int fd)
    : path_(path)
    , fd_(fd)
    , fileSize_(0)
    , bitmapSize_(0) {
    std::memset(&footer_, 0, sizeof(footer_));
    std::memset(&header_, 0, sizeof(header_));
}

VhdFile::~VhdFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::unique_ptr<VhdFile> VhdFile::open(const std::string& path, int maxParentDepth) {
    std::unique_ptr<VhdFile> root = openSingle(path);

    // Iterative walk up the differencing chain
    VhdFile* current = root.get();
    int depth = 0;
    while (current->diskType() == DiskType::Differencing) {
        if (++depth > maxParentDepth) {
            throw FormatError("Differencing chain of " + path + " is deeper than " +
                              std::to_string(maxParentDepth) + " links");
        }

        std::string parentPath = current->resolveParentPath();
        std::unique_ptr<VhdFile> parent = openSingle(parentPath);

        if (std::memcmp(parent->footer_.uniqueId, current->header_.parentUniqueId,
                        sizeof(current->header_.parentUniqueId)) != 0) {
            throw FormatError("Parent linkage mismatch for " + current->path_ + ": expected parent id " +
                              hexString(current->header_.parentUniqueId, 16) + ", " + parentPath +
                              " has id " + parent->uniqueIdString());
        }

        Logger::debug("Differencing disk " + current->path_ + " chains to " + parentPath);
        current->parentPath_ = parentPath;
        current->parent_ = std::move(parent);
        current = current->parent_.get();
    }

    return root;
}

std::unique_ptr<VhdFile> VhdFile::openSingle(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to open VHD " + path);
    }

    std::unique_ptr<VhdFile> file(new VhdFile(path, fd));

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to stat VHD " + path);
    }
    file->fileSize_ = static_cast<uint64_t>(st.st_size);

    file->readFooter();
    if (file->isExpandable()) {
        file->readHeader();
        file->readAllocationTable();
    }

    Logger::debug("Opened " + std::string(diskTypeName(file->diskType())) + " VHD " + path +
                  ", virtual size " + std::to_string(file->virtualSize()) +
                  (file->isExpandable() ? ", block size " + std::to_string(file->blockSize()) +
                                          ", " + std::to_string(file->blockCount()) + " table entries"
                                        : std::string()));
    return file;
}

void VhdFile::readFooter() {
    if (fileSize_ < kFooterSize) {
        throw FormatError(path_ + " is too small to hold a VHD footer");
    }

    readPhysical(fileSize_ - kFooterSize, reinterpret_cast<uint8_t*>(&footer_), kFooterSize);
    if (std::memcmp(footer_.cookie, kFooterCookie, sizeof(footer_.cookie)) != 0) {
        // Expandable disks keep a copy of the footer at offset zero
        Logger::warning("Footer cookie missing at end of " + path_ + ", trying footer copy");
        readPhysical(0, reinterpret_cast<uint8_t*>(&footer_), kFooterSize);
        if (std::memcmp(footer_.cookie, kFooterCookie, sizeof(footer_.cookie)) != 0) {
            throw FormatError(path_ + " has no VHD footer (missing 'conectix' cookie)");
        }
    }

    footerToHost(&footer_);

    uint32_t stored = footer_.checksum;
    footer_.checksum = 0;
    uint32_t computed = checksum(&footer_, sizeof(footer_));
    footer_.checksum = stored;
    if (stored != computed) {
        std::stringstream ss;
        ss << path_ << " footer checksum mismatch (stored 0x" << std::hex << stored
           << ", computed 0x" << computed << ")";
        throw FormatError(ss.str());
    }

    if (footer_.fileFormatVersion != kFileFormatVersion) {
        std::stringstream ss;
        ss << path_ << " has unsupported file format version 0x" << std::hex << footer_.fileFormatVersion;
        throw FormatError(ss.str());
    }

    switch (diskType()) {
        case DiskType::Fixed:
            if (footer_.currentSize > fileSize_ - kFooterSize) {
                throw FormatError(path_ + " is truncated: virtual size " + std::to_string(footer_.currentSize) +
                                  " exceeds data area of " + std::to_string(fileSize_ - kFooterSize) + " bytes");
            }
            break;
        case DiskType::Dynamic:
        case DiskType::Differencing:
            break;
        default:
            throw FormatError(path_ + " has unsupported disk type " + std::to_string(footer_.diskType));
    }
}

void VhdFile::readHeader() {
    if (footer_.dataOffset > fileSize_ || fileSize_ - footer_.dataOffset < kHeaderSize) {
        throw FormatError(path_ + " dynamic header offset " + std::to_string(footer_.dataOffset) +
                          " lies outside the file");
    }

    readPhysical(footer_.dataOffset, reinterpret_cast<uint8_t*>(&header_), kHeaderSize);
    if (std::memcmp(header_.cookie, kHeaderCookie, sizeof(header_.cookie)) != 0) {
        throw FormatError(path_ + " dynamic header cookie mismatch");
    }

    headerToHost(&header_);

    uint32_t stored = header_.checksum;
    header_.checksum = 0;
    uint32_t computed = checksum(&header_, sizeof(header_));
    header_.checksum = stored;
    if (stored != computed) {
        std::stringstream ss;
        ss << path_ << " dynamic header checksum mismatch (stored 0x" << std::hex << stored
           << ", computed 0x" << computed << ")";
        throw FormatError(ss.str());
    }

    if (header_.headerVersion != kHeaderVersion) {
        std::stringstream ss;
        ss << path_ << " has unsupported dynamic header version 0x" << std::hex << header_.headerVersion;
        throw FormatError(ss.str());
    }

    if (!isPowerOfTwo(header_.blockSize) || header_.blockSize < kSectorSize || header_.blockSize > kMaxBlockSize) {
        throw FormatError(path_ + " has invalid block size " + std::to_string(header_.blockSize));
    }

    uint64_t needed = (footer_.currentSize + header_.blockSize - 1) / header_.blockSize;
    if (header_.maxTableEntries < needed) {
        throw FormatError(path_ + " block allocation table has " + std::to_string(header_.maxTableEntries) +
                          " entries, virtual size needs " + std::to_string(needed));
    }

    uint32_t bitmapBytes = (sectorsPerBlock() + 7) / 8;
    bitmapSize_ = ((bitmapBytes + kSectorSize - 1) / kSectorSize) * kSectorSize;
}

void VhdFile::readAllocationTable() {
    uint64_t tableBytes = static_cast<uint64_t>(header_.maxTableEntries) * sizeof(uint32_t);
    if (header_.tableOffset > fileSize_ || fileSize_ - header_.tableOffset < tableBytes) {
        throw FormatError(path_ + " block allocation table lies outside the file");
    }

    bat_.resize(header_.maxTableEntries);
    readPhysical(header_.tableOffset, reinterpret_cast<uint8_t*>(bat_.data()), tableBytes);

    uint64_t blockSpan = static_cast<uint64_t>(bitmapSize_) + header_.blockSize;
    for (uint32_t i = 0; i < bat_.size(); ++i) {
        bat_[i] = be32toh(bat_[i]);
        if (bat_[i] == kBatEntryUnused) {
            continue;
        }
        uint64_t start = static_cast<uint64_t>(bat_[i]) * kSectorSize;
        if (start + blockSpan > fileSize_) {
            throw FormatError(path_ + " block " + std::to_string(i) + " at sector " + std::to_string(bat_[i]) +
                              " extends past the end of the file");
        }
    }
}

std::string VhdFile::resolveParentPath() const {
    std::filesystem::path childDir = std::filesystem::path(path_).parent_path();
    std::vector<std::string> candidates;

    for (const auto& locator : header_.parentLocators) {
        bool absolute = std::memcmp(locator.platformCode, "W2ku", 4) == 0;
        bool relative = std::memcmp(locator.platformCode, "W2ru", 4) == 0;
        if ((!absolute && !relative) || locator.platformDataLength == 0) {
            continue;
        }
        if (locator.platformDataOffset > fileSize_ ||
            fileSize_ - locator.platformDataOffset < locator.platformDataLength) {
            throw FormatError(path_ + " parent locator points outside the file");
        }

        std::vector<uint8_t> raw(locator.platformDataLength);
        readPhysical(locator.platformDataOffset, raw.data(), raw.size());
        std::string located = normalizeLocatorPath(utf16ToUtf8(raw.data(), raw.size(), true));
        if (located.empty()) {
            continue;
        }

        if (relative) {
            candidates.push_back((childDir / located).lexically_normal().string());
        } else {
            candidates.push_back(located);
        }
    }

    std::string name = utf16ToUtf8(reinterpret_cast<const uint8_t*>(header_.parentUnicodeName),
                                   sizeof(header_.parentUnicodeName), false);
    if (!name.empty()) {
        candidates.push_back((childDir / normalizeLocatorPath(name)).lexically_normal().string());
    }

    std::error_code ec;
    for (const auto& candidate : candidates) {
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
        Logger::debug("Parent candidate " + candidate + " of " + path_ + " not found");
    }

    throw FormatError("Cannot locate parent of differencing disk " + path_);
}

uint32_t VhdFile::allocatedBlockCount() const {
    return static_cast<uint32_t>(std::count_if(bat_.begin(), bat_.end(),
                                               [](uint32_t entry) { return entry != kBatEntryUnused; }));
}

std::string VhdFile::uniqueIdString() const {
    return hexString(footer_.uniqueId, sizeof(footer_.uniqueId));
}

bool VhdFile::isBlockAllocated(uint32_t block) const {
    return block < bat_.size() && bat_[block] != kBatEntryUnused;
}

uint64_t VhdFile::blockDataOffset(uint32_t block) const {
    return static_cast<uint64_t>(bat_[block]) * kSectorSize + bitmapSize_;
}

std::shared_ptr<const SectorBitmap> VhdFile::blockBitmap(uint32_t block) const {
    {
        std::lock_guard<std::mutex> lock(bitmapMutex_);
        auto it = bitmapCache_.find(block);
        if (it != bitmapCache_.end()) {
            return it->second;
        }
    }

    auto bitmap = std::make_shared<SectorBitmap>(bitmapSize_);
    readPhysical(static_cast<uint64_t>(bat_[block]) * kSectorSize, bitmap->data(), bitmap->size());

    std::lock_guard<std::mutex> lock(bitmapMutex_);
    if (bitmapCache_.size() >= kMaxCachedBitmaps) {
        bitmapCache_.clear();
    }
    bitmapCache_[block] = bitmap;
    return bitmap;
}

bool VhdFile::hasSector(uint64_t sector) const {
    if (!isExpandable()) {
        return sector < virtualSize() / kSectorSize;
    }

    uint64_t block = sector / sectorsPerBlock();
    if (block >= bat_.size() || bat_[block] == kBatEntryUnused) {
        return false;
    }
    auto bitmap = blockBitmap(static_cast<uint32_t>(block));
    return isSectorPresent(*bitmap, static_cast<uint32_t>(sector % sectorsPerBlock()));
}

void VhdFile::readVirtual(uint64_t offset, uint8_t* buf, size_t len) const {
    if (!isExpandable()) {
        readPhysical(offset, buf, len);
        return;
    }

    while (len > 0) {
        uint32_t block = static_cast<uint32_t>(offset / header_.blockSize);
        uint32_t within = static_cast<uint32_t>(offset % header_.blockSize);
        size_t chunk = std::min<size_t>(len, header_.blockSize - within);

        readPhysical(blockDataOffset(block) + within, buf, chunk);

        offset += chunk;
        buf += chunk;
        len -= chunk;
    }
}

void VhdFile::readPhysical(uint64_t offset, uint8_t* buf, size_t len) const {
    while (len > 0) {
        ssize_t n = ::pread(fd_, buf, len, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(),
                                    "Failed to read " + path_ + " at offset " + std::to_string(offset));
        }
        if (n == 0) {
            throw FormatError("Unexpected end of file reading " + path_ + " at offset " + std::to_string(offset));
        }
        buf += n;
        offset += static_cast<uint64_t>(n);
        len -= static_cast<size_t>(n);
    }
}

Footer VhdFile::fixedFooter() const {
    Footer f = footer_;
    f.diskType = static_cast<uint32_t>(DiskType::Fixed);
    f.dataOffset = kFixedDataOffset;
    f.checksum = 0;

    footerToDisk(&f);
    // Byte sums do not depend on field order, so the on-disk form checksums the same
    f.checksum = htobe32(checksum(&f, sizeof(f)));
    return f;
}

} // namespace vhd
