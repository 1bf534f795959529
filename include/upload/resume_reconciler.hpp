#pragma once

#include "common/byte_range.hpp"
#include "storage/page_store.hpp"
#include "upload/upload_metadata.hpp"
#include <string>
#include <vector>

struct ReconcileResult {
    enum class Mode {
        FRESH,
        RESUME
    };

    Mode mode{Mode::FRESH};
    std::vector<ByteRange> skipRanges;  // pages the blob already holds, RESUME only
};

/*
 * Decides whether a run starts a new blob or continues a partial upload.
 * Nothing is written to the store here; the caller creates the blob for a
 * FRESH result.
 */
class ResumeReconciler {
public:
    ResumeReconciler(PageStore& store, const std::string& blobName);

    // Throws CannotResumeError or MetadataMismatchError when only an overwrite can proceed
    ReconcileResult reconcile(const UploadMetadata& localMetadata, bool overwrite);

    // Every non-empty page range of the blob, following the listing cursor to the end
    std::vector<ByteRange> alreadyUploadedRanges();

private:
    PageStore& store_;
    std::string blobName_;
};
