#include "upload/resume_reconciler.hpp"
#include "common/logger.hpp"
#include "common/upload_error.hpp"

ResumeReconciler::ResumeReconciler(PageStore& store, const std::string& blobName)
    : store_(store)
    , blobName_(blobName) {
}

ReconcileResult ResumeReconciler::reconcile(const UploadMetadata& localMetadata, bool overwrite) {
    ReconcileResult result;

    BlobProperties properties = store_.getBlobProperties(blobName_);
    if (!properties.exists) {
        Logger::info("Blob " + blobName_ + " does not exist, starting a fresh upload");
        return result;
    }
    if (overwrite) {
        Logger::info("Blob " + blobName_ + " exists and will be overwritten");
        return result;
    }

    if (!properties.contentMd5.empty()) {
        throw CannotResumeError("Blob " + blobName_ + " already holds a completed upload (Content-MD5 " +
                                properties.contentMd5 + "), use overwrite to upload again");
    }

    std::optional<UploadMetadata> remoteMetadata = UploadMetadata::fromBlobMetadata(properties.metadata);
    if (!remoteMetadata) {
        throw CannotResumeError("There is no upload metadata associated with the existing blob " + blobName_ +
                                ", so the upload cannot be resumed; use overwrite");
    }

    std::vector<std::string> mismatches = compareMetadata(*remoteMetadata, localMetadata);
    if (!mismatches.empty()) {
        throw MetadataMismatchError(mismatches);
    }

    result.mode = ReconcileResult::Mode::RESUME;
    result.skipRanges = alreadyUploadedRanges();
    Logger::info("Resuming upload to " + blobName_ + ": " + std::to_string(result.skipRanges.size()) +
                 " page range(s), " + std::to_string(ranges::totalLength(result.skipRanges)) + " bytes already present");
    return result;
}

std::vector<ByteRange> ResumeReconciler::alreadyUploadedRanges() {
    std::vector<ByteRange> collected;
    std::string marker;
    int batches = 0;
    do {
        PageRangeBatch batch = store_.listPageRanges(blobName_, marker);
        collected.insert(collected.end(), batch.ranges.begin(), batch.ranges.end());
        marker = batch.nextMarker;
        ++batches;
    } while (!marker.empty());

    Logger::debug("Listed " + std::to_string(collected.size()) + " page range(s) of " + blobName_ + " in " +
                  std::to_string(batches) + " batch(es)");
    return ranges::normalize(collected);
}
