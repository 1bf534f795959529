#include "common/utils.hpp"
#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace utils {

std::string urlEncode(const std::string& str) {
    char* encoded = curl_easy_escape(nullptr, str.c_str(), static_cast<int>(str.length()));
    if (!encoded) {
        throw std::runtime_error("Failed to URL encode string");
    }
    std::string result(encoded);
    curl_free(encoded);
    return result;
}

std::string base64Encode(const uint8_t* data, size_t len) {
    if (len == 0) {
        return "";
    }
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::vector<uint8_t> base64Decode(const std::string& encoded) {
    std::string input = trim(encoded);
    if (input.empty()) {
        return {};
    }
    if (input.size() % 4 != 0) {
        throw std::invalid_argument("Invalid base64 length: " + std::to_string(input.size()));
    }

    std::vector<uint8_t> out(3 * input.size() / 4);
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    if (written < 0) {
        throw std::invalid_argument("Invalid base64 input");
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (input[input.size() - 1] == '=') ++padding;
    if (input[input.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::vector<uint8_t> hmacSha256(const std::vector<uint8_t>& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
              digest, &digestLen)) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return std::vector<uint8_t>(digest, digest + digestLen);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool endsWithIgnoreCase(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) {
        return false;
    }
    return toLower(str.substr(str.size() - suffix.size())) == toLower(suffix);
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

Md5Digest::Md5Digest() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("Failed to create OpenSSL context");
    }
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        throw std::runtime_error("Failed to initialize MD5 digest");
    }
}

Md5Digest::~Md5Digest() {
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
}

void Md5Digest::update(const uint8_t* data, size_t len) {
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, len) != 1) {
        throw std::runtime_error("Failed to update MD5 digest");
    }
}

std::vector<uint8_t> Md5Digest::finish() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), hash, &hashLen) != 1) {
        throw std::runtime_error("Failed to finalize MD5 digest");
    }
    return std::vector<uint8_t>(hash, hash + hashLen);
}

} // namespace utils
