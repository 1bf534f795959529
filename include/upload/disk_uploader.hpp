#pragma once

#include "common/byte_range.hpp"
#include "common/parallel_task_manager.hpp"
#include "storage/page_store.hpp"
#include "upload/range_planner.hpp"
#include "vhd/disk_stream.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>

// Called from worker threads after every completed range with the bytes transmitted so far in this run
using ProgressCallback = std::function<void(uint64_t transmittedBytes)>;

struct UploadContext {
    const vhd::VirtualDiskStream& stream;
    const UploadPlan& plan;
    PageStore& store;
    std::string blobName;
    size_t parallelism{0};              // 0 means 8 x hardware concurrency
    bool resume{false};
    int maxRetries{5};                  // retries after the first attempt of each range
    std::chrono::milliseconds retryDelay{2000};
};

/*
 * Writes every range of the plan to the page store from a pool of workers
 * that claim ranges through a shared cursor. A range failing with a transient
 * error is retried; the first range that cannot be written stops all workers
 * from claiming more work and is reported as UploadFailedError once the
 * in-flight writes have settled.
 */
class DiskUploader {
public:
    explicit DiskUploader(const UploadContext& context);

    void upload();

    void setProgressCallback(ProgressCallback callback);

    size_t workerCount() const;
    uint64_t transmittedBytes() const { return transmittedBytes_.load(); }
    size_t completedRanges() const { return completedRanges_.load(); }
    size_t retryCount() const { return retries_.load(); }

private:
    void workerLoop();
    void uploadRange(const ByteRange& range);
    void recordFailure(std::exception_ptr error);

    const UploadContext& context_;
    ProgressCallback progressCallback_;

    std::atomic<size_t> nextRange_;
    TaskHandle cancelHandle_;
    std::atomic<uint64_t> transmittedBytes_;
    std::atomic<size_t> completedRanges_;
    std::atomic<size_t> retries_;

    std::mutex errorMutex_;
    std::exception_ptr firstError_;
};
