#pragma once

#include "storage/page_store.hpp"
#include "upload/range_planner.hpp"
#include "upload/upload_config.hpp"
#include <cstdint>
#include <string>

struct UploadSummary {
    bool resumed{false};
    UploadPlan plan;
    uint64_t transmittedBytes{0};
    size_t retries{0};
    std::string contentMd5;             // base64, as stored on the blob
};

/*
 * One end-to-end run: local validation, metadata, reconciliation with the
 * blob, planning, the parallel upload and finally the Content-MD5 property.
 * Local checks run before the store is contacted.
 */
class UploadJob {
public:
    UploadJob(const UploadConfig& config, PageStore& store);

    UploadSummary run();

private:
    UploadConfig config_;
    PageStore& store_;
};
