#include "hex.hpp"

#include <stdexcept>

namespace blegw::util {
namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

std::string ToUpperHex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string           result;
  result.reserve(bytes.size() * 2);
  for (const char c : bytes) {
    const auto b = static_cast<unsigned char>(c);
    result.push_back(kHex[(b >> 4) & 0x0F]);
    result.push_back(kHex[b & 0x0F]);
  }
  return result;
}

std::string FromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("hex string has odd length");
  }

  std::string bytes;
  bytes.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexNibble(hex[i]);
    const int lo = HexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("non-hex character in '" + std::string(hex) + "'");
    }
    bytes.push_back(static_cast<char>((hi << 4) | lo));
  }
  return bytes;
}

} // namespace blegw::util
