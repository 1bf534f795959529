#include "vhd/disk_stream.hpp"
#include "common/logger.hpp"
#include "common/upload_error.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cstring>

namespace vhd {

namespace {

// Remembers the bitmap of the block last touched in one layer of the chain
class LayerCursor {
public:
    explicit LayerCursor(const VhdFile* layer)
        : layer_(layer)
        , block_(kNoBlock) {}

    const VhdFile* layer() const { return layer_; }

    bool hasSector(uint64_t sector) {
        if (!layer_->isExpandable()) {
            return layer_->hasSector(sector);
        }

        uint64_t block = sector / layer_->sectorsPerBlock();
        if (block != block_) {
            block_ = block;
            bitmap_.reset();
            if (block < layer_->blockCount() && layer_->isBlockAllocated(static_cast<uint32_t>(block))) {
                bitmap_ = layer_->blockBitmap(static_cast<uint32_t>(block));
            }
        }
        return bitmap_ && VhdFile::isSectorPresent(*bitmap_, static_cast<uint32_t>(sector % layer_->sectorsPerBlock()));
    }

private:
    static const uint64_t kNoBlock = ~0ULL;

    const VhdFile* layer_;
    uint64_t block_;
    std::shared_ptr<const SectorBitmap> bitmap_;
};

} // namespace

AllocatedRangeEnumerator::AllocatedRangeEnumerator(const VirtualDiskStream& stream)
    : stream_(stream)
    , nextUnit_(0)
    , footerReported_(false) {}

bool AllocatedRangeEnumerator::next(ByteRange& range) {
    uint64_t units = stream_.unitCount();
    uint64_t unit = stream_.allocationUnit();

    while (nextUnit_ < units && !stream_.isUnitAllocated(nextUnit_)) {
        ++nextUnit_;
    }

    if (nextUnit_ < units) {
        uint64_t first = nextUnit_;
        while (nextUnit_ < units && stream_.isUnitAllocated(nextUnit_)) {
            ++nextUnit_;
        }

        range.start = first * unit;
        range.end = std::min(nextUnit_ * unit, stream_.virtualSize()) - 1;
        if (range.end == stream_.virtualSize() - 1) {
            range.end = stream_.size() - 1;
            footerReported_ = true;
        }
        return true;
    }

    if (!footerReported_) {
        footerReported_ = true;
        range = stream_.footerRange();
        return true;
    }
    return false;
}

void AllocatedRangeEnumerator::reset() {
    nextUnit_ = 0;
    footerReported_ = false;
}

std::unique_ptr<VirtualDiskStream> VirtualDiskStream::open(const std::string& path) {
    return std::make_unique<VirtualDiskStream>(VhdFile::open(path));
}

VirtualDiskStream::VirtualDiskStream(std::unique_ptr<VhdFile> file)
    : file_(std::move(file)) {
    for (const VhdFile* layer = file_.get(); layer != nullptr; layer = layer->parent()) {
        chain_.push_back(layer);
    }

    Footer footer;
    if (file_->isExpandable()) {
        unit_ = file_->blockSize();
        footer = file_->fixedFooter();
    } else {
        unit_ = kFixedAllocationUnit;
        footer = file_->footer();
        footerToDisk(&footer);
    }
    const uint8_t* raw = reinterpret_cast<const uint8_t*>(&footer);
    footerBytes_.assign(raw, raw + kFooterSize);

    Logger::debug("Disk stream over " + file_->path() + ": " + std::to_string(chain_.size()) +
                  " layer(s), " + std::to_string(size()) + " bytes, allocation unit " + std::to_string(unit_));
}

uint64_t VirtualDiskStream::unitCount() const {
    return (virtualSize() + unit_ - 1) / unit_;
}

bool VirtualDiskStream::isUnitAllocated(uint64_t unit) const {
    if (!file_->isExpandable()) {
        return unit < unitCount();
    }

    uint64_t first = unit * unit_;
    uint64_t last = std::min(first + unit_, virtualSize()) - 1;
    for (const VhdFile* layer : chain_) {
        if (!layer->isExpandable()) {
            return true;
        }
        if (layer->blockCount() == 0) {
            continue;
        }
        uint64_t firstBlock = first / layer->blockSize();
        uint64_t lastBlock = std::min<uint64_t>(last / layer->blockSize(), layer->blockCount() - 1);
        for (uint64_t b = firstBlock; b <= lastBlock; ++b) {
            if (layer->isBlockAllocated(static_cast<uint32_t>(b))) {
                return true;
            }
        }
    }
    return false;
}

void VirtualDiskStream::readAt(uint64_t offset, uint8_t* buf, size_t len) const {
    if (offset > size() || len > size() - offset) {
        throw OutOfRangeError("Read of " + std::to_string(len) + " bytes at offset " + std::to_string(offset) +
                              " exceeds stream size " + std::to_string(size()));
    }

    if (offset < virtualSize()) {
        size_t diskLen = static_cast<size_t>(std::min<uint64_t>(len, virtualSize() - offset));
        readDisk(offset, buf, diskLen);
        offset += diskLen;
        buf += diskLen;
        len -= diskLen;
    }

    if (len > 0) {
        std::memcpy(buf, footerBytes_.data() + (offset - virtualSize()), len);
    }
}

std::vector<uint8_t> VirtualDiskStream::readAt(uint64_t offset, size_t len) const {
    std::vector<uint8_t> data(len);
    readAt(offset, data.data(), len);
    return data;
}

void VirtualDiskStream::readDisk(uint64_t offset, uint8_t* buf, size_t len) const {
    if (len == 0) {
        return;
    }
    if (!file_->isExpandable()) {
        file_->readPhysical(offset, buf, len);
        return;
    }

    std::vector<LayerCursor> cursors;
    cursors.reserve(chain_.size());
    for (const VhdFile* layer : chain_) {
        cursors.emplace_back(layer);
    }

    // Resolves the layer owning a sector; nullptr means zero fill
    auto ownerOf = [&cursors](uint64_t sector) -> const VhdFile* {
        for (auto& cursor : cursors) {
            if (cursor.hasSector(sector)) {
                return cursor.layer();
            }
        }
        return nullptr;
    };

    uint64_t end = offset + len;
    uint64_t runStart = offset;
    const VhdFile* runOwner = ownerOf(offset / kSectorSize);

    auto flush = [&](uint64_t runEnd) {
        uint8_t* dst = buf + (runStart - offset);
        size_t runLen = static_cast<size_t>(runEnd - runStart);
        if (runOwner == nullptr) {
            std::memset(dst, 0, runLen);
        } else {
            runOwner->readVirtual(runStart, dst, runLen);
        }
    };

    uint64_t pos = (offset / kSectorSize + 1) * kSectorSize;
    while (pos < end) {
        const VhdFile* owner = ownerOf(pos / kSectorSize);
        if (owner != runOwner) {
            flush(pos);
            runStart = pos;
            runOwner = owner;
        }
        pos += kSectorSize;
    }
    flush(end);
}

AllocatedRangeEnumerator VirtualDiskStream::enumerateAllocatedRanges() const {
    return AllocatedRangeEnumerator(*this);
}

std::vector<ByteRange> VirtualDiskStream::allocatedRanges() const {
    std::vector<ByteRange> result;
    AllocatedRangeEnumerator it = enumerateAllocatedRanges();
    ByteRange range;
    while (it.next(range)) {
        result.push_back(range);
    }
    return result;
}

std::vector<uint8_t> VirtualDiskStream::contentMd5() const {
    utils::Md5Digest digest;
    std::vector<uint8_t> buffer(static_cast<size_t>(unit_));
    std::vector<uint8_t> zeros(static_cast<size_t>(unit_), 0);

    for (uint64_t u = 0; u < unitCount(); ++u) {
        uint64_t start = u * unit_;
        size_t len = static_cast<size_t>(std::min(unit_, virtualSize() - start));
        if (isUnitAllocated(u)) {
            readDisk(start, buffer.data(), len);
            digest.update(buffer.data(), len);
        } else {
            digest.update(zeros.data(), len);
        }
    }
    digest.update(footerBytes_.data(), footerBytes_.size());
    return digest.finish();
}

} // namespace vhd
