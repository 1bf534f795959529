#pragma once

#include "common/byte_range.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

using BlobMetadata = std::map<std::string, std::string>;

struct BlobProperties {
    bool exists{false};
    uint64_t size{0};
    BlobMetadata metadata;
    std::string contentMd5;         // base64, empty when never set
};

struct PageRangeBatch {
    std::vector<ByteRange> ranges;
    std::string nextMarker;         // empty when the listing is complete
};

/*
 * Remote page blob store, addressed by blob name inside one container.
 * Implementations must allow concurrent writePages() calls on disjoint ranges.
 * Failures worth retrying throw TransientTransferError, all others StoreError.
 */
class PageStore {
public:
    virtual ~PageStore() = default;

    // Succeeds when the container already exists
    virtual void createContainer() = 0;

    // Creates or replaces the blob; size must be a multiple of the page size
    virtual void createPageBlob(const std::string& blobName, uint64_t size, const BlobMetadata& metadata) = 0;

    virtual BlobProperties getBlobProperties(const std::string& blobName) = 0;

    virtual void setBlobContentHash(const std::string& blobName, const std::string& contentMd5Base64) = 0;

    virtual void writePages(const std::string& blobName, uint64_t offset, const uint8_t* data, size_t len) = 0;

    // One batch of non-empty page ranges; pass the previous nextMarker to continue
    virtual PageRangeBatch listPageRanges(const std::string& blobName, const std::string& marker) = 0;
};
