#include "upload/disk_uploader.hpp"
#include "common/logger.hpp"
#include "common/parallel_task_manager.hpp"
#include "common/upload_error.hpp"
#include <algorithm>
#include <future>
#include <thread>
#include <vector>

DiskUploader::DiskUploader(const UploadContext& context)
    : context_(context)
    , nextRange_(0)
    , transmittedBytes_(0)
    , completedRanges_(0)
    , retries_(0) {
}

void DiskUploader::setProgressCallback(ProgressCallback callback) {
    progressCallback_ = std::move(callback);
}

size_t DiskUploader::workerCount() const {
    size_t workers = context_.parallelism;
    if (workers == 0) {
        workers = 8 * std::max(1u, std::thread::hardware_concurrency());
    }
    return std::max<size_t>(1, std::min(workers, context_.plan.ranges.size()));
}

void DiskUploader::upload() {
    const std::vector<ByteRange>& ranges = context_.plan.ranges;
    if (ranges.empty()) {
        Logger::info("Nothing to upload for " + context_.blobName);
        return;
    }

    size_t workers = workerCount();
    Logger::info(std::string(context_.resume ? "Resuming" : "Starting") + " upload of " +
                 std::to_string(ranges.size()) + " range(s), " + std::to_string(context_.plan.totalUploadableBytes) +
                 " bytes to " + context_.blobName + " with " + std::to_string(workers) + " worker(s)");

    {
        ParallelTaskManager taskManager(workers);
        std::vector<std::future<void>> results;
        for (size_t i = 0; i < workers; ++i) {
            results.push_back(taskManager.addTask([this]() { workerLoop(); }));
        }
        for (auto& result : results) {
            try {
                result.get();
            } catch (const std::exception&) {
                recordFailure(std::current_exception());
            }
        }
    }

    if (firstError_) {
        std::rethrow_exception(firstError_);
    }

    Logger::info("Uploaded " + std::to_string(transmittedBytes_.load()) + " bytes in " +
                 std::to_string(completedRanges_.load()) + " range(s), " + std::to_string(retries_.load()) +
                 " retried write(s)");
}

void DiskUploader::workerLoop() {
    const std::vector<ByteRange>& ranges = context_.plan.ranges;
    while (!cancelHandle_.isCancelled()) {
        size_t index = nextRange_.fetch_add(1);
        if (index >= ranges.size()) {
            return;
        }

        try {
            uploadRange(ranges[index]);
        } catch (const std::exception&) {
            recordFailure(std::current_exception());
            return;
        }
    }
}

void DiskUploader::uploadRange(const ByteRange& range) {
    std::vector<uint8_t> data = context_.stream.readAt(range.start, static_cast<size_t>(range.length()));

    for (int attempt = 0; ; ++attempt) {
        try {
            context_.store.writePages(context_.blobName, range.start, data.data(), data.size());
            break;
        } catch (const TransientTransferError& e) {
            if (attempt >= context_.maxRetries) {
                Logger::error("Giving up on range " + range.toString() + " after " +
                              std::to_string(attempt + 1) + " attempt(s): " + e.what());
                throw UploadFailedError(range, e.what());
            }
            if (cancelHandle_.isCancelled()) {
                throw UploadFailedError(range, std::string("upload cancelled after transient error: ") + e.what());
            }
            ++retries_;
            Logger::warning("Write of range " + range.toString() + " failed (" + e.what() + "), retry " +
                            std::to_string(attempt + 1) + " of " + std::to_string(context_.maxRetries));
            std::this_thread::sleep_for(context_.retryDelay);
        } catch (const StoreError& e) {
            Logger::error("Store rejected range " + range.toString() + ": " + e.what());
            throw UploadFailedError(range, e.what());
        }
    }

    uint64_t transmitted = transmittedBytes_.fetch_add(data.size()) + data.size();
    ++completedRanges_;
    if (progressCallback_) {
        progressCallback_(transmitted);
    }
}

void DiskUploader::recordFailure(std::exception_ptr error) {
    cancelHandle_.cancel();
    std::lock_guard<std::mutex> lock(errorMutex_);
    if (!firstError_) {
        firstError_ = error;
    }
}
