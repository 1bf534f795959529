#pragma once

#include "common/upload_error.hpp"
#include "storage/page_store.hpp"
#include <cstring>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/*
 * In-memory page blob container. Pages are stored sparsely, page range
 * listings are paged with a numeric marker, and writes at chosen offsets can
 * be scripted to fail with transient errors a given number of times.
 */
class FakePageStore : public PageStore {
public:
    static constexpr uint64_t kPageSize = 512;

    struct Blob {
        uint64_t size{0};
        BlobMetadata metadata;
        std::string contentMd5;
        std::map<uint64_t, std::vector<uint8_t>> pages;     // page offset -> page bytes
    };

    void createContainer() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++containerCreates_;
    }

    void createPageBlob(const std::string& blobName, uint64_t size, const BlobMetadata& metadata) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size % kPageSize != 0) {
            throw StoreError("size not page aligned", 400, "InvalidHeaderValue");
        }
        Blob blob;
        blob.size = size;
        blob.metadata = metadata;
        blobs_[blobName] = blob;
        ++blobCreates_;
    }

    BlobProperties getBlobProperties(const std::string& blobName) override {
        std::lock_guard<std::mutex> lock(mutex_);
        BlobProperties properties;
        auto it = blobs_.find(blobName);
        if (it != blobs_.end()) {
            properties.exists = true;
            properties.size = it->second.size;
            properties.metadata = it->second.metadata;
            properties.contentMd5 = it->second.contentMd5;
        }
        return properties;
    }

    void setBlobContentHash(const std::string& blobName, const std::string& contentMd5Base64) override {
        std::lock_guard<std::mutex> lock(mutex_);
        blobRef(blobName).contentMd5 = contentMd5Base64;
    }

    void writePages(const std::string& blobName, uint64_t offset, const uint8_t* data, size_t len) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++writeAttempts_;

        auto failure = scriptedFailures_.find(offset);
        if (failure != scriptedFailures_.end() && failure->second > 0) {
            --failure->second;
            throw TransientTransferError("scripted failure at offset " + std::to_string(offset), 503);
        }

        Blob& blob = blobRef(blobName);
        if (offset % kPageSize != 0 || len % kPageSize != 0 || offset + len > blob.size) {
            throw StoreError("invalid page range", 416, "InvalidPageRange");
        }
        for (size_t done = 0; done < len; done += kPageSize) {
            blob.pages[offset + done].assign(data + done, data + done + kPageSize);
        }
        writtenRanges_.emplace_back(offset, offset + len - 1);
        ++writeSuccesses_;
    }

    PageRangeBatch listPageRanges(const std::string& blobName, const std::string& marker) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++listCalls_;

        std::vector<ByteRange> all;
        for (const auto& page : blobRef(blobName).pages) {
            if (!all.empty() && all.back().end + 1 == page.first) {
                all.back().end += kPageSize;
            } else {
                all.emplace_back(page.first, page.first + kPageSize - 1);
            }
        }

        size_t start = marker.empty() ? 0 : std::stoul(marker);
        PageRangeBatch batch;
        for (size_t i = start; i < all.size() && batch.ranges.size() < listBatchSize_; ++i) {
            batch.ranges.push_back(all[i]);
        }
        size_t next = start + batch.ranges.size();
        if (next < all.size()) {
            batch.nextMarker = std::to_string(next);
        }
        return batch;
    }

    // Test controls

    void failWritesAt(uint64_t offset, int times) {
        std::lock_guard<std::mutex> lock(mutex_);
        scriptedFailures_[offset] = times;
    }

    void setListBatchSize(size_t size) { listBatchSize_ = size; }

    bool hasBlob(const std::string& blobName) {
        std::lock_guard<std::mutex> lock(mutex_);
        return blobs_.count(blobName) > 0;
    }

    Blob& blob(const std::string& blobName) { return blobRef(blobName); }

    // Contents as the service would return them; unwritten pages read as zero
    std::vector<uint8_t> contents(const std::string& blobName) {
        std::lock_guard<std::mutex> lock(mutex_);
        Blob& b = blobRef(blobName);
        std::vector<uint8_t> bytes(static_cast<size_t>(b.size), 0);
        for (const auto& page : b.pages) {
            std::memcpy(bytes.data() + page.first, page.second.data(), kPageSize);
        }
        return bytes;
    }

    // Pre-populates pages directly, as if an earlier run had written them
    void seedPages(const std::string& blobName, uint64_t offset, const std::vector<uint8_t>& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        Blob& b = blobRef(blobName);
        for (size_t done = 0; done < data.size(); done += kPageSize) {
            b.pages[offset + done].assign(data.begin() + done, data.begin() + done + kPageSize);
        }
    }

    int writeAttempts() const { return writeAttempts_; }
    int writeSuccesses() const { return writeSuccesses_; }
    int listCalls() const { return listCalls_; }
    int blobCreates() const { return blobCreates_; }
    int containerCreates() const { return containerCreates_; }
    const std::vector<ByteRange>& writtenRanges() const { return writtenRanges_; }

private:
    Blob& blobRef(const std::string& blobName) {
        auto it = blobs_.find(blobName);
        if (it == blobs_.end()) {
            throw StoreError("blob " + blobName + " not found", 404, "BlobNotFound");
        }
        return it->second;
    }

    std::mutex mutex_;
    std::map<std::string, Blob> blobs_;
    std::map<uint64_t, int> scriptedFailures_;
    std::vector<ByteRange> writtenRanges_;
    size_t listBatchSize_ = 1000;
    int writeAttempts_ = 0;
    int writeSuccesses_ = 0;
    int listCalls_ = 0;
    int blobCreates_ = 0;
    int containerCreates_ = 0;
};
