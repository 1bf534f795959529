#include "vhd/vhd_format.hpp"
#include <endian.h>

namespace vhd {

uint32_t checksum(const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    uint32_t sum = 0;
    for (size_t i = 0; i < len; ++i) {
        sum += p[i];
    }
    return ~sum;
}

void footerToHost(Footer* f) {
    f->features = be32toh(f->features);
    f->fileFormatVersion = be32toh(f->fileFormatVersion);
    f->dataOffset = be64toh(f->dataOffset);
    f->timestamp = be32toh(f->timestamp);
    f->creatorVersion = be32toh(f->creatorVersion);
    f->originalSize = be64toh(f->originalSize);
    f->currentSize = be64toh(f->currentSize);
    f->diskGeometry.cylinder = be16toh(f->diskGeometry.cylinder);
    f->diskType = be32toh(f->diskType);
    f->checksum = be32toh(f->checksum);
}

void footerToDisk(Footer* f) {
    f->features = htobe32(f->features);
    f->fileFormatVersion = htobe32(f->fileFormatVersion);
    f->dataOffset = htobe64(f->dataOffset);
    f->timestamp = htobe32(f->timestamp);
    f->creatorVersion = htobe32(f->creatorVersion);
    f->originalSize = htobe64(f->originalSize);
    f->currentSize = htobe64(f->currentSize);
    f->diskGeometry.cylinder = htobe16(f->diskGeometry.cylinder);
    f->diskType = htobe32(f->diskType);
    f->checksum = htobe32(f->checksum);
}

void headerToHost(Header* h) {
    h->dataOffset = be64toh(h->dataOffset);
    h->tableOffset = be64toh(h->tableOffset);
    h->headerVersion = be32toh(h->headerVersion);
    h->maxTableEntries = be32toh(h->maxTableEntries);
    h->blockSize = be32toh(h->blockSize);
    h->checksum = be32toh(h->checksum);
    h->parentTimestamp = be32toh(h->parentTimestamp);

    for (auto& locator : h->parentLocators) {
        locator.platformDataSpace = be32toh(locator.platformDataSpace);
        locator.platformDataLength = be32toh(locator.platformDataLength);
        locator.platformDataOffset = be64toh(locator.platformDataOffset);
    }
}

const char* diskTypeName(DiskType type) {
    switch (type) {
        case DiskType::Fixed:        return "Fixed";
        case DiskType::Dynamic:      return "Dynamic";
        case DiskType::Differencing: return "Differencing";
        default:                     return "Unknown";
    }
}

std::string utf16ToUtf8(const uint8_t* data, size_t len, bool littleEndian) {
    std::string out;
    for (size_t i = 0; i + 1 < len; i += 2) {
        uint32_t cp = littleEndian ? (data[i] | (data[i + 1] << 8)) : ((data[i] << 8) | data[i + 1]);
        if (cp == 0) {
            break;
        }

        // Surrogate pair
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 3 < len) {
            uint32_t low = littleEndian ? (data[i + 2] | (data[i + 3] << 8)) : ((data[i + 2] << 8) | data[i + 3]);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                i += 2;
            }
        }

        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }
    return out;
}

} // namespace vhd
