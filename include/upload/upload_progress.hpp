#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

// Turns the uploader's byte counter into completion, throughput and ETA lines
class UploadProgress {
public:
    UploadProgress(uint64_t totalBytes, uint64_t alreadyProcessedBytes,
                   std::chrono::milliseconds interval = std::chrono::seconds(1));

    // Thread safe; logs a status line at most once per interval and always at completion
    void update(uint64_t transmittedBytes);

    // Status after transmittedBytes of this run, elapsed time since construction
    std::string status(uint64_t transmittedBytes, std::chrono::steady_clock::duration elapsed) const;

    double percentComplete(uint64_t transmittedBytes) const;

private:
    uint64_t totalBytes_;
    uint64_t alreadyProcessedBytes_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point start_;

    std::mutex mutex_;
    std::chrono::steady_clock::time_point lastReport_;
};
