#include "storage/shared_key_signer.hpp"
#include "common/utils.hpp"
#include <stdexcept>

namespace {

// Standard headers in the order the service concatenates them
const char* const kSignedHeaders[] = {
    "content-encoding",
    "content-language",
    "content-length",
    "content-md5",
    "content-type",
    "date",
    "if-modified-since",
    "if-match",
    "if-none-match",
    "if-unmodified-since",
    "range",
};

} // namespace

SharedKeySigner::SharedKeySigner(const std::string& accountName, const std::string& accountKeyBase64)
    : accountName_(accountName)
    , key_(utils::base64Decode(accountKeyBase64)) {
    if (key_.empty()) {
        throw std::invalid_argument("Storage account key is empty");
    }
}

std::string SharedKeySigner::stringToSign(const StorageRequest& request) const {
    std::map<std::string, std::string> lowered;
    for (const auto& header : request.headers) {
        lowered[utils::toLower(header.first)] = utils::trim(header.second);
    }

    std::string result = request.method + "\n";
    for (const char* name : kSignedHeaders) {
        if (std::string(name) == "content-length") {
            if (request.contentLength > 0) {
                result += std::to_string(request.contentLength);
            }
        } else {
            auto it = lowered.find(name);
            if (it != lowered.end()) {
                result += it->second;
            }
        }
        result += "\n";
    }

    // std::map keeps the x-ms- headers sorted by lowercase name
    for (const auto& header : lowered) {
        if (header.first.compare(0, 5, "x-ms-") == 0) {
            result += header.first + ":" + header.second + "\n";
        }
    }

    result += "/" + accountName_ + request.path;

    std::map<std::string, std::string> params;
    for (const auto& param : request.query) {
        params[utils::toLower(param.first)] = param.second;
    }
    for (const auto& param : params) {
        result += "\n" + param.first + ":" + param.second;
    }
    return result;
}

std::string SharedKeySigner::authorization(const StorageRequest& request) const {
    std::vector<uint8_t> signature = utils::hmacSha256(key_, stringToSign(request));
    return "SharedKey " + accountName_ + ":" + utils::base64Encode(signature);
}
