#pragma once

#include "vhd/vhd_format.hpp"
#include <endian.h>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace testimage {

const uint64_t kMiB = 1024 * 1024;

inline void fillUniqueId(uint8_t* id, uint8_t seed) {
    for (int i = 0; i < 16; ++i) {
        id[i] = static_cast<uint8_t>(seed + i * 7);
    }
}

// Footer in on-disk byte order with a valid checksum
inline vhd::Footer makeFooter(vhd::DiskType type, uint64_t virtualSize, uint64_t dataOffset,
                              uint32_t timestamp, uint8_t idSeed) {
    vhd::Footer f;
    std::memset(&f, 0, sizeof(f));
    std::memcpy(f.cookie, vhd::kFooterCookie, 8);
    f.features = 2;
    f.fileFormatVersion = vhd::kFileFormatVersion;
    f.dataOffset = dataOffset;
    f.timestamp = timestamp;
    std::memcpy(f.creatorApp, "vhdu", 4);
    f.creatorVersion = 0x00010000;
    std::memcpy(f.creatorHostOs, "Wi2k", 4);
    f.originalSize = virtualSize;
    f.currentSize = virtualSize;
    f.diskGeometry.cylinder = 1024;
    f.diskGeometry.heads = 16;
    f.diskGeometry.sectorsPerTrack = 63;
    f.diskType = static_cast<uint32_t>(type);
    fillUniqueId(f.uniqueId, idSeed);

    vhd::footerToDisk(&f);
    f.checksum = htobe32(vhd::checksum(&f, sizeof(f)));
    return f;
}

inline void writeBytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("Failed to write test image " + path);
    }
}

inline std::vector<uint8_t> readBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Fixed image: the data followed by a footer
inline void writeFixed(const std::string& path, const std::vector<uint8_t>& data,
                       uint32_t timestamp = 600000000, uint8_t idSeed = 1) {
    vhd::Footer f = makeFooter(vhd::DiskType::Fixed, data.size(), vhd::kFixedDataOffset, timestamp, idSeed);
    std::vector<uint8_t> bytes(data);
    const uint8_t* raw = reinterpret_cast<const uint8_t*>(&f);
    bytes.insert(bytes.end(), raw, raw + sizeof(f));
    writeBytes(path, bytes);
}

/*
 * Dynamic or differencing image assembled in memory. Layout: footer copy,
 * header, allocation table, parent locator, blocks (bitmap then data), footer.
 */
class DynamicImage {
public:
    DynamicImage(uint64_t virtualSize, uint32_t blockSize, uint8_t idSeed = 2)
        : virtualSize_(virtualSize)
        , blockSize_(blockSize)
        , idSeed_(idSeed)
        , timestamp_(600000000) {
        entries_ = static_cast<uint32_t>((virtualSize + blockSize - 1) / blockSize);
        uint32_t bitmapBytes = blockSize / vhd::kSectorSize / 8;
        bitmapSize_ = ((bitmapBytes + vhd::kSectorSize - 1) / vhd::kSectorSize) * vhd::kSectorSize;
    }

    // Marks the block allocated without marking any sector present
    void allocateBlock(uint32_t block) {
        blocks_.emplace(block, Block{std::vector<uint8_t>(bitmapSize_, 0), std::vector<uint8_t>(blockSize_, 0)});
    }

    // Stores bytes at a sector-aligned virtual offset and marks their sectors present
    void write(uint64_t offset, const std::vector<uint8_t>& bytes) {
        for (uint64_t i = 0; i < bytes.size(); ++i) {
            uint64_t pos = offset + i;
            uint32_t block = static_cast<uint32_t>(pos / blockSize_);
            allocateIfMissing(block);
            Block& b = blocks_[block];
            uint32_t within = static_cast<uint32_t>(pos % blockSize_);
            b.data[within] = bytes[i];
            uint32_t sector = within / vhd::kSectorSize;
            b.bitmap[sector >> 3] |= static_cast<uint8_t>(0x80 >> (sector & 7));
        }
    }

    // Marks sectors present that hold zeros
    void markPresent(uint64_t offset, uint64_t len) {
        for (uint64_t pos = offset; pos < offset + len; pos += vhd::kSectorSize) {
            uint32_t block = static_cast<uint32_t>(pos / blockSize_);
            allocateIfMissing(block);
            uint32_t sector = static_cast<uint32_t>((pos % blockSize_) / vhd::kSectorSize);
            blocks_[block].bitmap[sector >> 3] |= static_cast<uint8_t>(0x80 >> (sector & 7));
        }
    }

    // Turns the image into a differencing disk pointing at parentFileName beside it
    void setParent(const std::string& parentFileName, uint8_t parentIdSeed) {
        parentName_ = parentFileName;
        parentIdSeed_ = parentIdSeed;
    }

    void setTimestamp(uint32_t timestamp) { timestamp_ = timestamp; }

    void save(const std::string& path) const {
        bool differencing = !parentName_.empty();
        vhd::DiskType type = differencing ? vhd::DiskType::Differencing : vhd::DiskType::Dynamic;
        vhd::Footer footer = makeFooter(type, virtualSize_, vhd::kFooterSize, timestamp_, idSeed_);

        const uint64_t headerOffset = vhd::kFooterSize;
        const uint64_t tableOffset = headerOffset + vhd::kHeaderSize;
        uint64_t tableBytes = ((uint64_t(entries_) * 4 + vhd::kSectorSize - 1) / vhd::kSectorSize) * vhd::kSectorSize;
        uint64_t locatorOffset = tableOffset + tableBytes;

        std::vector<uint8_t> locator;
        if (differencing) {
            std::string rel = ".\\" + parentName_;
            for (char c : rel) {
                locator.push_back(static_cast<uint8_t>(c));
                locator.push_back(0);
            }
        }
        uint64_t locatorSpace = ((locator.size() + vhd::kSectorSize - 1) / vhd::kSectorSize) * vhd::kSectorSize;
        uint64_t cursor = locatorOffset + locatorSpace;

        std::vector<uint32_t> bat(entries_, htobe32(vhd::kBatEntryUnused));
        std::map<uint32_t, uint64_t> placement;
        for (const auto& entry : blocks_) {
            placement[entry.first] = cursor;
            bat[entry.first] = htobe32(static_cast<uint32_t>(cursor / vhd::kSectorSize));
            cursor += bitmapSize_ + blockSize_;
        }

        std::vector<uint8_t> image(cursor + vhd::kFooterSize, 0);
        std::memcpy(image.data(), &footer, sizeof(footer));
        std::memcpy(image.data() + cursor, &footer, sizeof(footer));

        vhd::Header h;
        std::memset(&h, 0, sizeof(h));
        std::memcpy(h.cookie, vhd::kHeaderCookie, 8);
        h.dataOffset = htobe64(vhd::kFixedDataOffset);
        h.tableOffset = htobe64(tableOffset);
        h.headerVersion = htobe32(vhd::kHeaderVersion);
        h.maxTableEntries = htobe32(entries_);
        h.blockSize = htobe32(blockSize_);
        if (differencing) {
            fillUniqueId(h.parentUniqueId, parentIdSeed_);
            for (size_t i = 0; i < parentName_.size() && i < 255; ++i) {
                h.parentUnicodeName[2 * i + 1] = parentName_[i];
            }
            std::memcpy(h.parentLocators[0].platformCode, "W2ru", 4);
            h.parentLocators[0].platformDataSpace = htobe32(static_cast<uint32_t>(locatorSpace));
            h.parentLocators[0].platformDataLength = htobe32(static_cast<uint32_t>(locator.size()));
            h.parentLocators[0].platformDataOffset = htobe64(locatorOffset);
            std::memcpy(image.data() + locatorOffset, locator.data(), locator.size());
        }
        h.checksum = htobe32(vhd::checksum(&h, sizeof(h)));
        std::memcpy(image.data() + headerOffset, &h, sizeof(h));

        std::memcpy(image.data() + tableOffset, bat.data(), bat.size() * 4);
        for (const auto& entry : blocks_) {
            uint64_t at = placement.at(entry.first);
            std::memcpy(image.data() + at, entry.second.bitmap.data(), bitmapSize_);
            std::memcpy(image.data() + at + bitmapSize_, entry.second.data.data(), blockSize_);
        }

        writeBytes(path, image);
    }

private:
    struct Block {
        std::vector<uint8_t> bitmap;
        std::vector<uint8_t> data;
    };

    void allocateIfMissing(uint32_t block) {
        if (blocks_.find(block) == blocks_.end()) {
            allocateBlock(block);
        }
    }

    uint64_t virtualSize_;
    uint32_t blockSize_;
    uint32_t entries_;
    uint32_t bitmapSize_;
    uint8_t idSeed_;
    uint32_t timestamp_;
    std::string parentName_;
    uint8_t parentIdSeed_ = 0;
    std::map<uint32_t, Block> blocks_;
};

// Temporary directory removed with the fixture
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "vhdupload-test-XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const { return (std::filesystem::path(path_) / name).string(); }

private:
    std::string path_;
};

inline std::vector<uint8_t> pattern(size_t len, uint8_t seed) {
    std::vector<uint8_t> bytes(len);
    for (size_t i = 0; i < len; ++i) {
        bytes[i] = static_cast<uint8_t>(seed + (i * 31) % 251 + 1);
    }
    return bytes;
}

} // namespace testimage
