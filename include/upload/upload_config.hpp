#pragma once

#include "storage/azure_page_blob_client.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct UploadConfig {
    std::string localVhdPath;
    std::string accountName;
    std::string accountKey;
    std::string sasToken;
    std::string endpointSuffix = "core.windows.net";
    std::string blobEndpoint;
    std::string containerName = "vhds";
    std::string blobName;               // ".vhd" is appended when missing
    bool overwrite = false;
    int parallelism = 0;                // 0 means 8 x hardware concurrency
    int maxRetries = 5;
    int retryDelayMs = 2000;
    uint64_t pageSize = 512;
    uint64_t pageSetSize = 4 * 1024 * 1024;
    uint64_t sizeUnit = 1024 * 1024;    // virtual size must be a multiple of this
    std::string logFile = "/tmp/vhdupload.log";
    std::string logLevel = "info";
};

// Overlays the keys present in a JSON file; throws std::runtime_error on unreadable files or bad values
void loadUploadConfigFile(const std::string& path, UploadConfig& config);

// Appends ".vhd" unless the name already ends with it in any case
std::string normalizeBlobName(const std::string& name);

// Every problem with the configuration, empty when it is usable
std::vector<std::string> validateUploadConfig(const UploadConfig& config);

StorageAccountConfig toStorageAccountConfig(const UploadConfig& config);
