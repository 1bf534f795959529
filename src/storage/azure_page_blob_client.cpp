#include "storage/azure_page_blob_client.hpp"
#include "common/logger.hpp"
#include "common/upload_error.hpp"
#include "common/utils.hpp"
#include <curl/curl.h>
#include <ctime>
#include <regex>
#include <stdexcept>

const char* const AzurePageBlobClient::kApiVersion = "2020-10-02";

namespace {

const char kMetadataHeaderPrefix[] = "x-ms-meta-";

size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, std::map<std::string, std::string>* headers) {
    size_t realsize = size * nitems;
    std::string line(buffer, realsize);
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        (*headers)[utils::toLower(utils::trim(line.substr(0, colon)))] = utils::trim(line.substr(colon + 1));
    }
    return realsize;
}

std::string rfc1123Now() {
    std::time_t now = std::time(nullptr);
    std::tm gmt;
    gmtime_r(&now, &gmt);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &gmt);
    return buf;
}

// Encodes each path segment, keeping the separators
std::string encodePath(const std::string& path) {
    std::string result;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        std::string segment = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        result += utils::urlEncode(segment);
        if (slash == std::string::npos) {
            break;
        }
        result += "/";
        start = slash + 1;
    }
    return result;
}

} // namespace

AzurePageBlobClient::AzurePageBlobClient(const StorageAccountConfig& config)
    : config_(config) {
    if (config_.accountName.empty()) {
        throw std::invalid_argument("Storage account name is required");
    }
    if (config_.accountKey.empty() && config_.sasToken.empty()) {
        throw std::invalid_argument("Storage account key or SAS token is required");
    }

    curl_global_init(CURL_GLOBAL_ALL);

    std::string endpoint = config_.blobEndpoint.empty()
        ? "https://" + config_.accountName + ".blob." + config_.endpointSuffix
        : config_.blobEndpoint;
    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }

    // Emulator endpoints carry the account in the path, e.g. http://127.0.0.1:10000/devstoreaccount1
    size_t scheme = endpoint.find("://");
    size_t pathStart = endpoint.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (pathStart != std::string::npos) {
        pathPrefix_ = endpoint.substr(pathStart);
        endpoint_ = endpoint.substr(0, pathStart);
    } else {
        endpoint_ = endpoint;
    }

    if (config_.sasToken.empty()) {
        signer_ = std::make_unique<SharedKeySigner>(config_.accountName, config_.accountKey);
    } else if (config_.sasToken[0] == '?') {
        config_.sasToken.erase(0, 1);
    }

    Logger::debug("Blob endpoint " + endpoint_ + pathPrefix_ + ", container " + config_.containerName +
                  (signer_ ? ", Shared Key auth" : ", SAS auth"));
}

AzurePageBlobClient::~AzurePageBlobClient() {
    curl_global_cleanup();
}

std::string AzurePageBlobClient::containerPath() const {
    return pathPrefix_ + "/" + encodePath(config_.containerName);
}

std::string AzurePageBlobClient::blobPath(const std::string& blobName) const {
    return containerPath() + "/" + encodePath(blobName);
}

std::string AzurePageBlobClient::buildUrl(const StorageRequest& request) const {
    std::string url = endpoint_ + request.path;
    std::string query;
    for (const auto& param : request.query) {
        query += (query.empty() ? "" : "&") + utils::urlEncode(param.first) + "=" + utils::urlEncode(param.second);
    }
    if (!config_.sasToken.empty()) {
        query += (query.empty() ? "" : "&") + config_.sasToken;
    }
    if (!query.empty()) {
        url += "?" + query;
    }
    return url;
}

AzurePageBlobClient::Response AzurePageBlobClient::perform(StorageRequest& request, const uint8_t* body, size_t len) {
    request.headers["x-ms-date"] = rfc1123Now();
    request.headers["x-ms-version"] = kApiVersion;
    request.contentLength = len;
    if (request.method == "PUT") {
        request.headers["Content-Type"] = "application/octet-stream";
    }
    if (signer_) {
        request.headers["Authorization"] = signer_->authorization(request);
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransientTransferError("Failed to initialize CURL");
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header : request.headers) {
        headers = curl_slist_append(headers, (header.first + ": " + header.second).c_str());
    }
    if (request.method == "PUT") {
        headers = curl_slist_append(headers, ("Content-Length: " + std::to_string(len)).c_str());
    }
    headers = curl_slist_append(headers, "Expect:");

    std::string url = buildUrl(request);
    Response response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 300L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (request.method == "PUT") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, len > 0 ? reinterpret_cast<const char*>(body) : "");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(len));
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw TransientTransferError(request.method + " " + request.path + " failed: " + curl_easy_strerror(res));
    }

    Logger::debug(request.method + " " + request.path + " -> " + std::to_string(response.status));
    return response;
}

std::string AzurePageBlobClient::errorCodeOf(const Response& response) const {
    auto it = response.headers.find("x-ms-error-code");
    if (it != response.headers.end()) {
        return it->second;
    }
    return parseErrorCode(response.body);
}

void AzurePageBlobClient::classifyStatus(long status, const std::string& operation, const std::string& errorCode) {
    std::string message = operation + " failed with HTTP " + std::to_string(status) +
                          (errorCode.empty() ? std::string() : " (" + errorCode + ")");
    if (status == 408 || status == 429 || status >= 500) {
        throw TransientTransferError(message, status);
    }
    throw StoreError(message, status, errorCode);
}

void AzurePageBlobClient::createContainer() {
    StorageRequest request;
    request.method = "PUT";
    request.path = containerPath();
    request.query["restype"] = "container";

    Response response = perform(request, nullptr, 0);
    if (response.status == 201) {
        Logger::info("Created container " + config_.containerName);
        return;
    }
    std::string code = errorCodeOf(response);
    if (response.status == 409 && code == "ContainerAlreadyExists") {
        Logger::debug("Container " + config_.containerName + " already exists");
        return;
    }
    classifyStatus(response.status, "Create container " + config_.containerName, code);
}

void AzurePageBlobClient::createPageBlob(const std::string& blobName, uint64_t size, const BlobMetadata& metadata) {
    StorageRequest request;
    request.method = "PUT";
    request.path = blobPath(blobName);
    request.headers["x-ms-blob-type"] = "PageBlob";
    request.headers["x-ms-blob-content-length"] = std::to_string(size);
    for (const auto& entry : metadata) {
        request.headers[kMetadataHeaderPrefix + entry.first] = entry.second;
    }

    Response response = perform(request, nullptr, 0);
    if (response.status != 201) {
        classifyStatus(response.status, "Create page blob " + blobName, errorCodeOf(response));
    }
    Logger::info("Created page blob " + blobName + " of " + std::to_string(size) + " bytes");
}

BlobProperties AzurePageBlobClient::getBlobProperties(const std::string& blobName) {
    StorageRequest request;
    request.method = "HEAD";
    request.path = blobPath(blobName);

    Response response = perform(request, nullptr, 0);
    BlobProperties properties;
    if (response.status == 404) {
        return properties;
    }
    if (response.status != 200) {
        classifyStatus(response.status, "Get properties of " + blobName, errorCodeOf(response));
    }

    properties.exists = true;
    const size_t prefixLen = sizeof(kMetadataHeaderPrefix) - 1;
    for (const auto& header : response.headers) {
        if (header.first.compare(0, prefixLen, kMetadataHeaderPrefix) == 0) {
            properties.metadata[header.first.substr(prefixLen)] = header.second;
        } else if (header.first == "content-md5") {
            properties.contentMd5 = header.second;
        } else if (header.first == "content-length") {
            properties.size = std::stoull(header.second);
        }
    }
    return properties;
}

void AzurePageBlobClient::setBlobContentHash(const std::string& blobName, const std::string& contentMd5Base64) {
    StorageRequest request;
    request.method = "PUT";
    request.path = blobPath(blobName);
    request.query["comp"] = "properties";
    request.headers["x-ms-blob-content-md5"] = contentMd5Base64;

    Response response = perform(request, nullptr, 0);
    if (response.status != 200) {
        classifyStatus(response.status, "Set content MD5 of " + blobName, errorCodeOf(response));
    }
}

void AzurePageBlobClient::writePages(const std::string& blobName, uint64_t offset, const uint8_t* data, size_t len) {
    StorageRequest request;
    request.method = "PUT";
    request.path = blobPath(blobName);
    request.query["comp"] = "page";
    request.headers["x-ms-page-write"] = "update";
    request.headers["x-ms-range"] = "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + len - 1);

    Response response = perform(request, data, len);
    if (response.status != 201) {
        classifyStatus(response.status, "Write pages " + request.headers["x-ms-range"] + " of " + blobName,
                       errorCodeOf(response));
    }
}

PageRangeBatch AzurePageBlobClient::listPageRanges(const std::string& blobName, const std::string& marker) {
    StorageRequest request;
    request.method = "GET";
    request.path = blobPath(blobName);
    request.query["comp"] = "pagelist";
    if (!marker.empty()) {
        request.query["marker"] = marker;
    }

    Response response = perform(request, nullptr, 0);
    if (response.status != 200) {
        classifyStatus(response.status, "List page ranges of " + blobName, errorCodeOf(response));
    }
    return parsePageList(response.body);
}

PageRangeBatch AzurePageBlobClient::parsePageList(const std::string& xml) {
    static const std::regex rangeRegex("<PageRange>\\s*<Start>(\\d+)</Start>\\s*<End>(\\d+)</End>\\s*</PageRange>");
    static const std::regex markerRegex("<NextMarker>([^<]*)</NextMarker>");

    PageRangeBatch batch;
    for (std::sregex_iterator it(xml.begin(), xml.end(), rangeRegex), end; it != end; ++it) {
        batch.ranges.emplace_back(std::stoull((*it)[1]), std::stoull((*it)[2]));
    }

    std::smatch matches;
    if (std::regex_search(xml, matches, markerRegex)) {
        batch.nextMarker = matches[1];
    }
    return batch;
}

std::string AzurePageBlobClient::parseErrorCode(const std::string& xml) {
    static const std::regex codeRegex("<Code>([^<]*)</Code>");
    std::smatch matches;
    if (std::regex_search(xml, matches, codeRegex)) {
        return matches[1];
    }
    return "";
}
