#pragma once

#include "storage/page_store.hpp"
#include "storage/shared_key_signer.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

struct StorageAccountConfig {
    std::string accountName;
    std::string accountKey;         // base64 Shared Key; empty when a SAS token is used
    std::string sasToken;
    std::string endpointSuffix = "core.windows.net";
    std::string blobEndpoint;       // explicit endpoint URL, overrides account + suffix
    std::string containerName = "vhds";
};

/*
 * PageStore over the Azure Blob REST API. Every request runs on its own curl
 * easy handle, so one client may be shared by all upload workers.
 */
class AzurePageBlobClient : public PageStore {
public:
    static const char* const kApiVersion;

    explicit AzurePageBlobClient(const StorageAccountConfig& config);
    ~AzurePageBlobClient() override;

    AzurePageBlobClient(const AzurePageBlobClient&) = delete;
    AzurePageBlobClient& operator=(const AzurePageBlobClient&) = delete;

    void createContainer() override;
    void createPageBlob(const std::string& blobName, uint64_t size, const BlobMetadata& metadata) override;
    BlobProperties getBlobProperties(const std::string& blobName) override;
    void setBlobContentHash(const std::string& blobName, const std::string& contentMd5Base64) override;
    void writePages(const std::string& blobName, uint64_t offset, const uint8_t* data, size_t len) override;
    PageRangeBatch listPageRanges(const std::string& blobName, const std::string& marker) override;

    const std::string& endpoint() const { return endpoint_; }

    // Parses a Get Page Ranges response body
    static PageRangeBatch parsePageList(const std::string& xml);

    // Extracts <Code> from an error response body
    static std::string parseErrorCode(const std::string& xml);

    // Throws TransientTransferError for 408, 429 and 5xx, StoreError for any other failure status
    static void classifyStatus(long status, const std::string& operation, const std::string& errorCode);

private:
    struct Response {
        long status{0};
        std::string body;
        std::map<std::string, std::string> headers;     // lowercase names
    };

    Response perform(StorageRequest& request, const uint8_t* body, size_t len);
    std::string containerPath() const;
    std::string blobPath(const std::string& blobName) const;
    std::string buildUrl(const StorageRequest& request) const;
    std::string errorCodeOf(const Response& response) const;

    StorageAccountConfig config_;
    std::string endpoint_;          // scheme and host, no trailing slash
    std::string pathPrefix_;        // path part of an explicit endpoint
    std::unique_ptr<SharedKeySigner> signer_;
};
