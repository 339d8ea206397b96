#include "core/util/Hash.hpp"
#include "core/util/Errors.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>

namespace offcache {
namespace core {
namespace util {

namespace {

std::string digestHex(const void* data, size_t size) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data, size, hash, &length, EVP_sha256(), nullptr) != 1) {
        throw CacheError("EVP_Digest(sha256) failed");
    }
    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace

std::string sha256Hex(const std::string& data) {
    return digestHex(data.data(), data.size());
}

std::string sha256Hex(const std::vector<uint8_t>& data) {
    return digestHex(data.data(), data.size());
}

} // namespace util
} // namespace core
} // namespace offcache
