#include "upload/upload_progress.hpp"
#include "common/logger.hpp"
#include <cstdio>

UploadProgress::UploadProgress(uint64_t totalBytes, uint64_t alreadyProcessedBytes,
                               std::chrono::milliseconds interval)
    : totalBytes_(totalBytes)
    , alreadyProcessedBytes_(alreadyProcessedBytes)
    , interval_(interval)
    , start_(std::chrono::steady_clock::now())
    , lastReport_(start_) {
}

double UploadProgress::percentComplete(uint64_t transmittedBytes) const {
    if (totalBytes_ == 0) {
        return 100.0;
    }
    return 100.0 * static_cast<double>(alreadyProcessedBytes_ + transmittedBytes) / static_cast<double>(totalBytes_);
}

std::string UploadProgress::status(uint64_t transmittedBytes, std::chrono::steady_clock::duration elapsed) const {
    double seconds = std::chrono::duration<double>(elapsed).count();
    double megabits = static_cast<double>(transmittedBytes) * 8.0 / 1e6;
    double throughput = seconds > 0.0 ? megabits / seconds : 0.0;

    uint64_t done = alreadyProcessedBytes_ + transmittedBytes;
    uint64_t remaining = totalBytes_ > done ? totalBytes_ - done : 0;
    long eta = 0;
    if (transmittedBytes > 0 && seconds > 0.0) {
        eta = static_cast<long>(static_cast<double>(remaining) * seconds / static_cast<double>(transmittedBytes));
    }

    char buf[160];
    std::snprintf(buf, sizeof(buf), "Completed: %5.1f%% [%10.2f MB] RemainingTime: %02ldh:%02ldm:%02lds Throughput: %.0f Mb/sec",
                  percentComplete(transmittedBytes), static_cast<double>(done) / (1024.0 * 1024.0),
                  eta / 3600, (eta / 60) % 60, eta % 60, throughput);
    return buf;
}

void UploadProgress::update(uint64_t transmittedBytes) {
    auto now = std::chrono::steady_clock::now();
    bool finished = alreadyProcessedBytes_ + transmittedBytes >= totalBytes_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!finished && now - lastReport_ < interval_) {
            return;
        }
        lastReport_ = now;
    }
    Logger::info(status(transmittedBytes, now - start_));
}
