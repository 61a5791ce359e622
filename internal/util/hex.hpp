#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace dsnp::util {

inline std::string HexEncode(const std::uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

inline std::string HexEncode(std::string_view bytes) {
  return HexEncode(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
}

inline bool IsHexDigit(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

inline bool IsHexDigits(std::string_view value) {
  if (value.empty()) {
    return false;
  }
  for (char c : value) {
    if (!IsHexDigit(c)) {
      return false;
    }
  }
  return true;
}

// "0x" followed by exactly `digits` hex digits.
inline bool IsPrefixedHex(std::string_view value, std::size_t digits) {
  if (value.size() != digits + 2 || value.substr(0, 2) != "0x") {
    return false;
  }
  return IsHexDigits(value.substr(2));
}

} // namespace dsnp::util
