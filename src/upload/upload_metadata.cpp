#include "upload/upload_metadata.hpp"
#include "common/logger.hpp"
#include "common/upload_error.hpp"
#include "common/utils.hpp"
#include <nlohmann/json.hpp>
#include <sys/stat.h>
#include <cerrno>
#include <ctime>
#include <filesystem>
#include <system_error>

const char* const UploadMetadata::kBlobMetadataKey = "diskmetadata";

namespace {

std::string formatUtc(int64_t seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm gmt;
    gmtime_r(&t, &gmt);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &gmt);
    return buf;
}

int64_t parseUtc(const std::string& text) {
    std::tm tm = {};
    const char* end = strptime(text.c_str(), "%Y-%m-%dT%H:%M:%SZ", &tm);
    if (end == nullptr || *end != '\0') {
        throw std::invalid_argument("Invalid UTC timestamp: " + text);
    }
    return static_cast<int64_t>(timegm(&tm));
}

std::string hexDigest(const std::vector<uint8_t>& digest) {
    static const char hex[] = "0123456789abcdef";
    std::string out;
    for (uint8_t b : digest) {
        out += hex[b >> 4];
        out += hex[b & 0x0F];
    }
    return out;
}

} // namespace

UploadMetadata UploadMetadata::fromLocalVhd(const std::string& path, const vhd::VirtualDiskStream& stream) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to stat " + path);
    }

    UploadMetadata metadata;
    metadata.fileName = std::filesystem::path(path).filename().string();
    metadata.fileSize = stream.size();
    metadata.vhdTimestamp = vhd::kVhdEpochUnix + stream.file().timestamp();
    metadata.lastModifiedTime = static_cast<int64_t>(st.st_mtime);

    Logger::info("Computing MD5 of " + path + " (" + std::to_string(stream.size()) + " bytes)");
    metadata.md5Hash = stream.contentMd5();
    Logger::info("MD5 of " + path + " is " + hexDigest(metadata.md5Hash));
    return metadata;
}

std::string UploadMetadata::toJson() const {
    nlohmann::json fileMetadata = {
        {"fileName", fileName},
        {"fileSize", fileSize},
        {"vhdTimeStamp", formatUtc(vhdTimestamp)},
        {"lastModifiedTime", formatUtc(lastModifiedTime)},
        {"md5Hash", utils::base64Encode(md5Hash)}
    };
    nlohmann::json record = {{"fileMetaData", fileMetadata}};
    return record.dump();
}

UploadMetadata UploadMetadata::fromJson(const std::string& json) {
    nlohmann::json record = nlohmann::json::parse(json);
    const nlohmann::json& fileMetadata = record.at("fileMetaData");

    UploadMetadata metadata;
    metadata.fileName = fileMetadata.at("fileName").get<std::string>();
    metadata.fileSize = fileMetadata.at("fileSize").get<uint64_t>();
    metadata.vhdTimestamp = parseUtc(fileMetadata.at("vhdTimeStamp").get<std::string>());
    metadata.lastModifiedTime = parseUtc(fileMetadata.at("lastModifiedTime").get<std::string>());
    metadata.md5Hash = utils::base64Decode(fileMetadata.at("md5Hash").get<std::string>());
    return metadata;
}

BlobMetadata UploadMetadata::toBlobMetadata() const {
    BlobMetadata metadata;
    metadata[kBlobMetadataKey] = utils::base64Encode(toJson());
    return metadata;
}

std::optional<UploadMetadata> UploadMetadata::fromBlobMetadata(const BlobMetadata& metadata) {
    for (const auto& entry : metadata) {
        if (utils::toLower(entry.first) != kBlobMetadataKey) {
            continue;
        }
        try {
            std::vector<uint8_t> decoded = utils::base64Decode(entry.second);
            return fromJson(std::string(decoded.begin(), decoded.end()));
        } catch (const std::exception& e) {
            throw CannotResumeError("Upload metadata stored with the blob is unreadable (" + std::string(e.what()) +
                                    "), use overwrite to upload again");
        }
    }
    return std::nullopt;
}

std::vector<std::string> compareMetadata(const UploadMetadata& remote, const UploadMetadata& local) {
    std::vector<std::string> mismatches;

    if (remote.fileName != local.fileName) {
        mismatches.push_back("File name mismatch: blob records '" + remote.fileName + "', local file is '" +
                             local.fileName + "'");
    }
    if (remote.fileSize != local.fileSize) {
        mismatches.push_back("Size mismatch: blob records " + std::to_string(remote.fileSize) +
                             " bytes, local disk is " + std::to_string(local.fileSize) + " bytes");
    }
    if (remote.vhdTimestamp != local.vhdTimestamp) {
        mismatches.push_back("VHD timestamp mismatch: blob records " + formatUtc(remote.vhdTimestamp) +
                             ", local disk is " + formatUtc(local.vhdTimestamp));
    }
    if (remote.lastModifiedTime != local.lastModifiedTime) {
        mismatches.push_back("Last modified time mismatch: blob records " + formatUtc(remote.lastModifiedTime) +
                             ", local file is " + formatUtc(local.lastModifiedTime));
    }
    if (remote.md5Hash != local.md5Hash) {
        mismatches.push_back("MD5 mismatch: blob records " + hexDigest(remote.md5Hash) + ", local disk is " +
                             hexDigest(local.md5Hash));
    }
    return mismatches;
}
