#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace utils {

std::string urlEncode(const std::string& str);

std::string base64Encode(const uint8_t* data, size_t len);
inline std::string base64Encode(const std::vector<uint8_t>& data) {
    return base64Encode(data.data(), data.size());
}
inline std::string base64Encode(const std::string& data) {
    return base64Encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

// Throws std::invalid_argument on malformed input
std::vector<uint8_t> base64Decode(const std::string& encoded);

std::vector<uint8_t> hmacSha256(const std::vector<uint8_t>& key, const std::string& message);

std::string toLower(std::string str);
bool endsWithIgnoreCase(const std::string& str, const std::string& suffix);
std::string trim(const std::string& str);

// Incremental MD5, the digest the blob service keeps as Content-MD5
class Md5Digest {
public:
    Md5Digest();
    ~Md5Digest();

    Md5Digest(const Md5Digest&) = delete;
    Md5Digest& operator=(const Md5Digest&) = delete;

    void update(const uint8_t* data, size_t len);
    std::vector<uint8_t> finish();

private:
    void* ctx_;
};

} // namespace utils
