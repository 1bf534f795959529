#pragma once

#include "common/byte_range.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// Base of every failure raised while validating, planning or uploading a disk
class UploadError : public std::runtime_error {
public:
    explicit UploadError(const std::string& message) : std::runtime_error(message) {}
};

// Bad cookie, checksum, version or structure in the VHD file
class FormatError : public UploadError {
public:
    explicit FormatError(const std::string& message) : UploadError(message) {}
};

// Virtual size is not a whole multiple of the store's size unit
class SizeConstraintError : public UploadError {
public:
    explicit SizeConstraintError(const std::string& message) : UploadError(message) {}
};

// Read past the end of a disk stream
class OutOfRangeError : public UploadError {
public:
    explicit OutOfRangeError(const std::string& message) : UploadError(message) {}
};

// Existing blob cannot be resumed; only an overwrite can proceed
class CannotResumeError : public UploadError {
public:
    explicit CannotResumeError(const std::string& message) : UploadError(message) {}
};

class MetadataMismatchError : public UploadError {
public:
    explicit MetadataMismatchError(const std::vector<std::string>& mismatches)
        : UploadError(joinMessages(mismatches))
        , mismatches_(mismatches) {}

    const std::vector<std::string>& mismatches() const { return mismatches_; }

private:
    static std::string joinMessages(const std::vector<std::string>& mismatches) {
        std::string message = "Local VHD does not match the previously uploaded VHD:";
        for (const auto& m : mismatches) {
            message += "\n  " + m;
        }
        return message;
    }

    std::vector<std::string> mismatches_;
};

// Network or server-side failure of a single request; safe to retry
class TransientTransferError : public UploadError {
public:
    explicit TransientTransferError(const std::string& message, long httpStatus = 0)
        : UploadError(message), httpStatus_(httpStatus) {}

    long httpStatus() const { return httpStatus_; }

private:
    long httpStatus_;
};

// Non-retryable rejection from the remote store
class StoreError : public UploadError {
public:
    StoreError(const std::string& message, long httpStatus, const std::string& errorCode)
        : UploadError(message), httpStatus_(httpStatus), errorCode_(errorCode) {}

    long httpStatus() const { return httpStatus_; }
    const std::string& errorCode() const { return errorCode_; }

private:
    long httpStatus_;
    std::string errorCode_;
};

// Retry budget for one range was exhausted
class UploadFailedError : public UploadError {
public:
    UploadFailedError(const ByteRange& range, const std::string& cause)
        : UploadError("Failed to upload range " + range.toString() + ": " + cause)
        , range_(range) {}

    const ByteRange& range() const { return range_; }

private:
    ByteRange range_;
};
