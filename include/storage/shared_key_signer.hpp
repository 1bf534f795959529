#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

// One blob service request as the signer and the HTTP layer see it
struct StorageRequest {
    std::string method;
    std::string path;                               // URL-encoded, e.g. "/vhds/disk.vhd"
    std::map<std::string, std::string> query;       // decoded names and values
    std::map<std::string, std::string> headers;
    uint64_t contentLength{0};
};

/*
 * Shared Key authorization for the blob service: HMAC-SHA256 with the
 * decoded account key over the verb, the standard headers, the canonicalized
 * x-ms- headers and the canonicalized resource.
 */
class SharedKeySigner {
public:
    // Throws std::invalid_argument when the key is not valid base64
    SharedKeySigner(const std::string& accountName, const std::string& accountKeyBase64);

    std::string stringToSign(const StorageRequest& request) const;

    // Value for the Authorization header: "SharedKey account:signature"
    std::string authorization(const StorageRequest& request) const;

private:
    std::string accountName_;
    std::vector<uint8_t> key_;
};
