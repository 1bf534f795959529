#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

/*
 * On-disk layout of the VHD format. Every multi-byte field is stored big endian;
 * the decoder converts Footer and Header to host order right after reading them.
 */
namespace vhd {

#pragma pack(push, 1)

struct Footer {
    char        cookie[8];              // "conectix"
    uint32_t    features;
    uint32_t    fileFormatVersion;      // 0x00010000
    uint64_t    dataOffset;             // Header offset; all ones for Fixed disks
    uint32_t    timestamp;              // Seconds since 2000-01-01 00:00:00 UTC
    char        creatorApp[4];
    uint32_t    creatorVersion;
    char        creatorHostOs[4];
    uint64_t    originalSize;
    uint64_t    currentSize;            // Virtual disk size in bytes
    struct DiskGeometry {
        uint16_t cylinder;
        uint8_t  heads;
        uint8_t  sectorsPerTrack;
    } diskGeometry;
    uint32_t    diskType;               // see DiskType
    uint32_t    checksum;
    uint8_t     uniqueId[16];
    uint8_t     savedState;
    char        reserved[427];
};

struct ParentLocatorEntry {
    char        platformCode[4];        // "W2ku" absolute, "W2ru" relative
    uint32_t    platformDataSpace;      // Sectors reserved for the locator
    uint32_t    platformDataLength;     // Locator length in bytes
    uint32_t    reserved;
    uint64_t    platformDataOffset;     // Absolute file offset of the locator
};

struct Header {
    char        cookie[8];              // "cxsparse"
    uint64_t    dataOffset;             // Unused, all ones
    uint64_t    tableOffset;            // Absolute offset of the block allocation table
    uint32_t    headerVersion;          // 0x00010000
    uint32_t    maxTableEntries;
    uint32_t    blockSize;              // Data bytes per block, excludes the sector bitmap
    uint32_t    checksum;
    uint8_t     parentUniqueId[16];
    uint32_t    parentTimestamp;
    uint32_t    reserved1;
    char        parentUnicodeName[512]; // UTF-16BE
    ParentLocatorEntry parentLocators[8];
    char        reserved2[256];
};

#pragma pack(pop)

static_assert(sizeof(Footer) == 512, "VHD footer must be 512 bytes");
static_assert(sizeof(Header) == 1024, "VHD dynamic header must be 1024 bytes");

enum class DiskType : uint32_t {
    None = 0,
    Fixed = 2,
    Dynamic = 3,
    Differencing = 4,
};

const char kFooterCookie[] = "conectix";
const char kHeaderCookie[] = "cxsparse";
const uint32_t kFileFormatVersion = 0x00010000;
const uint32_t kHeaderVersion = 0x00010000;

const uint32_t kSectorSize = 512;
const uint32_t kFooterSize = sizeof(Footer);
const uint32_t kHeaderSize = sizeof(Header);
const uint32_t kBatEntryUnused = 0xFFFFFFFF;
const uint64_t kFixedDataOffset = 0xFFFFFFFFFFFFFFFFULL;

// Largest block the format allows; keeps bitmaps and read buffers bounded
const uint32_t kMaxBlockSize = 256u * 1024 * 1024;

// VHD timestamps count seconds from 2000-01-01 00:00:00 UTC
const int64_t kVhdEpochUnix = 946684800;

// Ones' complement of the byte sum, taken with the checksum field zeroed
uint32_t checksum(const void* data, size_t len);

void footerToHost(Footer* f);
void footerToDisk(Footer* f);
void headerToHost(Header* h);

const char* diskTypeName(DiskType type);

// Decodes a UTF-16 buffer (little or big endian) into UTF-8, stopping at the first NUL
std::string utf16ToUtf8(const uint8_t* data, size_t len, bool littleEndian);

} // namespace vhd
