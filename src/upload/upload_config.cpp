#include "upload/upload_config.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "upload/range_planner.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template<typename T>
void readKey(const json& doc, const char* key, T& target) {
    if (doc.contains(key)) {
        target = doc.at(key).get<T>();
    }
}

} // namespace

void loadUploadConfigFile(const std::string& path, UploadConfig& config) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file " + path);
    }

    try {
        json doc = json::parse(file);
        readKey(doc, "localVhdPath", config.localVhdPath);
        readKey(doc, "accountName", config.accountName);
        readKey(doc, "accountKey", config.accountKey);
        readKey(doc, "sasToken", config.sasToken);
        readKey(doc, "endpointSuffix", config.endpointSuffix);
        readKey(doc, "blobEndpoint", config.blobEndpoint);
        readKey(doc, "containerName", config.containerName);
        readKey(doc, "blobName", config.blobName);
        readKey(doc, "overwrite", config.overwrite);
        readKey(doc, "parallelism", config.parallelism);
        readKey(doc, "maxRetries", config.maxRetries);
        readKey(doc, "retryDelayMs", config.retryDelayMs);
        readKey(doc, "pageSize", config.pageSize);
        readKey(doc, "pageSetSize", config.pageSetSize);
        readKey(doc, "sizeUnit", config.sizeUnit);
        readKey(doc, "logFile", config.logFile);
        readKey(doc, "logLevel", config.logLevel);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
}

std::string normalizeBlobName(const std::string& name) {
    if (name.empty() || utils::endsWithIgnoreCase(name, ".vhd")) {
        return name;
    }
    return name + ".vhd";
}

std::vector<std::string> validateUploadConfig(const UploadConfig& config) {
    std::vector<std::string> errors;

    if (config.localVhdPath.empty()) {
        errors.push_back("Local VHD path is required (--localvhdpath)");
    }
    if (config.accountName.empty()) {
        errors.push_back("Storage account name is required (--stgaccountname)");
    }
    if (config.accountKey.empty() && config.sasToken.empty()) {
        errors.push_back("Storage account key (--stgaccountkey or AZURE_STORAGE_KEY) or SAS token (--sastoken) is required");
    }
    if (config.containerName.empty()) {
        errors.push_back("Container name must not be empty (--containername)");
    }
    if (config.blobName.empty()) {
        errors.push_back("Blob name is required (--blobname)");
    }
    if (config.parallelism < 0) {
        errors.push_back("Parallelism must not be negative");
    }
    if (config.maxRetries < 0) {
        errors.push_back("Retry count must not be negative (--max-retries)");
    }
    if (config.retryDelayMs < 0) {
        errors.push_back("Retry delay must not be negative");
    }
    std::string geometry = RangePlanner::checkGeometry(config.pageSize, config.pageSetSize);
    if (!geometry.empty()) {
        errors.push_back(geometry);
    }
    if (config.sizeUnit == 0) {
        errors.push_back("Size unit must be positive");
    }
    LogLevel level;
    if (!Logger::parseLevel(config.logLevel, level)) {
        errors.push_back("Unknown log level '" + config.logLevel + "' (--log-level)");
    }
    return errors;
}

StorageAccountConfig toStorageAccountConfig(const UploadConfig& config) {
    StorageAccountConfig account;
    account.accountName = config.accountName;
    account.accountKey = config.accountKey;
    account.sasToken = config.sasToken;
    account.endpointSuffix = config.endpointSuffix;
    account.blobEndpoint = config.blobEndpoint;
    account.containerName = config.containerName;
    return account;
}
