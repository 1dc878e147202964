#ifndef CM_COMMON_HEX_UTILS_H
#define CM_COMMON_HEX_UTILS_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cm::common {

std::string BytesToHex(const std::uint8_t* data, std::size_t len);
std::string BytesToHex(const std::vector<std::uint8_t>& bytes);

// Accepts upper or lower case digits; surrounding whitespace is ignored.
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);
bool HexToBytes(const std::string& hex, std::vector<std::uint8_t>& out);

bool HexToKey32(std::string_view hex, std::array<std::uint8_t, 32>& out,
                std::string& error);

}  // namespace cm::common

#endif  // CM_COMMON_HEX_UTILS_H
