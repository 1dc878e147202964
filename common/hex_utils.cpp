#include "hex_utils.h"

#include <cctype>
#include <string_view>

namespace cm::common {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

std::string_view TrimView(std::string_view in) {
  std::size_t start = 0;
  while (start < in.size() &&
         std::isspace(static_cast<unsigned char>(in[start])) != 0) {
    ++start;
  }
  std::size_t end = in.size();
  while (end > start &&
         std::isspace(static_cast<unsigned char>(in[end - 1])) != 0) {
    --end;
  }
  return in.substr(start, end - start);
}

}  // namespace

std::string BytesToHex(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return {};
  }
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2] = kHex[data[i] >> 4];
    out[i * 2 + 1] = kHex[data[i] & 0x0F];
  }
  return out;
}

std::string BytesToHex(const std::vector<std::uint8_t>& bytes) {
  return BytesToHex(bytes.data(), bytes.size());
}

bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out) {
  out.clear();
  hex = TrimView(hex);
  if ((hex.size() % 2) != 0) {
    return false;
  }
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexNibble(hex[i]);
    const int lo = HexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out.clear();
      return false;
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

bool HexToBytes(const std::string& hex, std::vector<std::uint8_t>& out) {
  return HexToBytes(std::string_view(hex), out);
}

bool HexToKey32(std::string_view hex, std::array<std::uint8_t, 32>& out,
                std::string& error) {
  error.clear();
  std::vector<std::uint8_t> bytes;
  if (!HexToBytes(hex, bytes)) {
    error = "invalid hex";
    return false;
  }
  if (bytes.size() != out.size()) {
    error = "expected 32 bytes";
    return false;
  }
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = bytes[i];
  }
  return true;
}

}  // namespace cm::common
