#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace offcache {
namespace core {
namespace util {

// SHA-256 в нижнем регистре hex (64 символа)
std::string sha256Hex(const std::string& data);
std::string sha256Hex(const std::vector<uint8_t>& data);

} // namespace util
} // namespace core
} // namespace offcache
