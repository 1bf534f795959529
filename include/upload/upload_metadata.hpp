#pragma once

#include "storage/page_store.hpp"
#include "vhd/disk_stream.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/*
 * Descriptive record of the local disk, stored with the blob so that a later
 * run can tell whether the blob holds a partial upload of the same disk.
 */
struct UploadMetadata {
    static const char* const kBlobMetadataKey;

    std::string fileName;
    uint64_t fileSize{0};               // stream size: virtual size plus footer
    int64_t vhdTimestamp{0};            // footer creation time, Unix seconds
    int64_t lastModifiedTime{0};        // local file mtime, Unix seconds
    std::vector<uint8_t> md5Hash;       // MD5 of the full stream

    static UploadMetadata fromLocalVhd(const std::string& path, const vhd::VirtualDiskStream& stream);

    // Single "diskmetadata" entry holding base64 encoded JSON
    BlobMetadata toBlobMetadata() const;

    // std::nullopt when the blob carries no record; CannotResumeError when it is unreadable
    static std::optional<UploadMetadata> fromBlobMetadata(const BlobMetadata& metadata);

    std::string toJson() const;
    static UploadMetadata fromJson(const std::string& json);
};

// One message per differing field, empty when the records match
std::vector<std::string> compareMetadata(const UploadMetadata& remote, const UploadMetadata& local);
