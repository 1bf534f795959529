#include <gtest/gtest.h>
#include "common/upload_error.hpp"
#include "upload/disk_uploader.hpp"
#include "upload/range_planner.hpp"
#include "fake_page_store.hpp"
#include "vhd_test_image.hpp"
#include <algorithm>
#include <mutex>

using testimage::kMiB;

class DiskUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        testimage::writeFixed(dir_.file("disk.vhd"), testimage::pattern(6 * kMiB, 8));
        stream_ = vhd::VirtualDiskStream::open(dir_.file("disk.vhd"));

        RangePlanner planner(512, kMiB);
        plan_ = planner.locateUploadableRanges(*stream_, {});
        store_.createPageBlob(blobName_, stream_->size(), BlobMetadata());
    }

    UploadContext context(size_t parallelism = 4) {
        UploadContext ctx{*stream_, plan_, store_, blobName_};
        ctx.parallelism = parallelism;
        ctx.maxRetries = 5;
        ctx.retryDelay = std::chrono::milliseconds(0);
        return ctx;
    }

    testimage::TempDir dir_;
    std::unique_ptr<vhd::VirtualDiskStream> stream_;
    UploadPlan plan_;
    FakePageStore store_;
    std::string blobName_ = "disk.vhd";
};

TEST_F(DiskUploaderTest, UploadsEveryRange) {
    UploadContext ctx = context();
    DiskUploader uploader(ctx);
    uploader.upload();

    EXPECT_EQ(plan_.ranges.size(), 7u);
    EXPECT_EQ(uploader.completedRanges(), plan_.ranges.size());
    EXPECT_EQ(uploader.transmittedBytes(), stream_->size());
    EXPECT_EQ(uploader.retryCount(), 0u);
    EXPECT_EQ(store_.contents(blobName_), stream_->readAt(0, static_cast<size_t>(stream_->size())));
}

TEST_F(DiskUploaderTest, RetriesTransientFailures) {
    store_.failWritesAt(kMiB, 2);
    UploadContext ctx = context();
    DiskUploader uploader(ctx);
    uploader.upload();

    EXPECT_EQ(uploader.retryCount(), 2u);
    EXPECT_EQ(uploader.transmittedBytes(), stream_->size());
    EXPECT_EQ(store_.writeAttempts(), static_cast<int>(plan_.ranges.size()) + 2);
    EXPECT_EQ(store_.writeSuccesses(), static_cast<int>(plan_.ranges.size()));
    EXPECT_EQ(store_.contents(blobName_), stream_->readAt(0, static_cast<size_t>(stream_->size())));
}

TEST_F(DiskUploaderTest, ExhaustedRetriesFailTheUpload) {
    store_.failWritesAt(2 * kMiB, 100);
    UploadContext ctx = context();
    ctx.maxRetries = 2;
    DiskUploader uploader(ctx);

    try {
        uploader.upload();
        FAIL() << "Expected UploadFailedError";
    } catch (const UploadFailedError& e) {
        EXPECT_EQ(e.range(), ByteRange(2 * kMiB, 3 * kMiB - 1));
    }
    EXPECT_EQ(uploader.retryCount(), 2u);
}

TEST_F(DiskUploaderTest, StoreRejectionIsNotRetried) {
    UploadContext ctx = context(1);
    ctx.blobName = "missing.vhd";
    DiskUploader uploader(ctx);

    EXPECT_THROW(uploader.upload(), UploadFailedError);
    EXPECT_EQ(store_.writeAttempts(), 1);
    EXPECT_EQ(uploader.retryCount(), 0u);
}

TEST_F(DiskUploaderTest, FailureStopsClaimingRanges) {
    store_.failWritesAt(kMiB, 100);
    UploadContext ctx = context(1);
    ctx.maxRetries = 0;
    DiskUploader uploader(ctx);

    EXPECT_THROW(uploader.upload(), UploadFailedError);
    EXPECT_EQ(store_.writeSuccesses(), 1);
    EXPECT_EQ(store_.writeAttempts(), 2);
    EXPECT_EQ(uploader.completedRanges(), 1u);
}

TEST_F(DiskUploaderTest, ReportsProgressPerRange) {
    UploadContext ctx = context(2);
    DiskUploader uploader(ctx);

    std::mutex mutex;
    std::vector<uint64_t> reports;
    uploader.setProgressCallback([&](uint64_t transmitted) {
        std::lock_guard<std::mutex> lock(mutex);
        reports.push_back(transmitted);
    });
    uploader.upload();

    ASSERT_EQ(reports.size(), plan_.ranges.size());
    std::sort(reports.begin(), reports.end());
    EXPECT_EQ(reports.back(), stream_->size());
}

TEST_F(DiskUploaderTest, EmptyPlanWritesNothing) {
    UploadPlan empty;
    UploadContext ctx{*stream_, empty, store_, blobName_};
    DiskUploader uploader(ctx);

    EXPECT_NO_THROW(uploader.upload());
    EXPECT_EQ(store_.writeAttempts(), 0);
    EXPECT_EQ(uploader.transmittedBytes(), 0u);
}

TEST_F(DiskUploaderTest, WorkerCountIsBoundedByRanges) {
    UploadContext wide = context(100);
    EXPECT_EQ(DiskUploader(wide).workerCount(), plan_.ranges.size());

    UploadContext narrow = context(3);
    EXPECT_EQ(DiskUploader(narrow).workerCount(), 3u);

    UploadContext automatic = context(0);
    EXPECT_GE(DiskUploader(automatic).workerCount(), 1u);
    EXPECT_LE(DiskUploader(automatic).workerCount(), plan_.ranges.size());
}
