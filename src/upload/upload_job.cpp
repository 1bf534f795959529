#include "upload/upload_job.hpp"
#include "common/logger.hpp"
#include "common/parallel_task_manager.hpp"
#include "common/utils.hpp"
#include "upload/disk_uploader.hpp"
#include "upload/resume_reconciler.hpp"
#include "upload/upload_metadata.hpp"
#include "upload/upload_progress.hpp"
#include "vhd/disk_stream.hpp"
#include "vhd/vhd_validator.hpp"

UploadJob::UploadJob(const UploadConfig& config, PageStore& store)
    : config_(config)
    , store_(store) {
    config_.blobName = normalizeBlobName(config_.blobName);
}

UploadSummary UploadJob::run() {
    UploadSummary summary;

    vhd::VirtualDiskStream stream(vhd::validateVhd(config_.localVhdPath));
    vhd::validateVhdSize(stream.file(), config_.sizeUnit);
    RangePlanner planner(config_.pageSize, config_.pageSetSize);

    UploadMetadata localMetadata = UploadMetadata::fromLocalVhd(config_.localVhdPath, stream);

    store_.createContainer();

    ResumeReconciler reconciler(store_, config_.blobName);
    ReconcileResult reconciled = reconciler.reconcile(localMetadata, config_.overwrite);
    summary.resumed = reconciled.mode == ReconcileResult::Mode::RESUME;

    if (!summary.resumed) {
        store_.createPageBlob(config_.blobName, stream.size(), localMetadata.toBlobMetadata());
    }

    summary.plan = planner.locateUploadableRanges(stream, reconciled.skipRanges);
    {
        ParallelTaskManager scanners(static_cast<size_t>(config_.parallelism));
        planner.detectEmptyRanges(stream, summary.plan, scanners);
    }

    UploadContext context{stream, summary.plan, store_, config_.blobName};
    context.parallelism = static_cast<size_t>(config_.parallelism);
    context.resume = summary.resumed;
    context.maxRetries = config_.maxRetries;
    context.retryDelay = std::chrono::milliseconds(config_.retryDelayMs);

    UploadProgress progress(stream.size(), summary.plan.alreadyProcessedBytes + summary.plan.zeroBytesDropped);
    DiskUploader uploader(context);
    uploader.setProgressCallback([&progress](uint64_t transmitted) { progress.update(transmitted); });
    uploader.upload();

    summary.transmittedBytes = uploader.transmittedBytes();
    summary.retries = uploader.retryCount();

    summary.contentMd5 = utils::base64Encode(localMetadata.md5Hash);
    store_.setBlobContentHash(config_.blobName, summary.contentMd5);
    Logger::info("Upload of " + config_.localVhdPath + " to " + config_.blobName + " completed, Content-MD5 " +
                 summary.contentMd5);
    return summary;
}
