#include "internal/announcement/identifiers.hpp"

#include <cstdint>
#include <optional>

#include "internal/util/hex.hpp"

namespace dsnp::announcement {

namespace {

constexpr std::string_view kAnnouncementIdScheme = "dsnp://";
constexpr std::size_t      kContentHashDigits    = 64;
constexpr std::size_t      kSignatureDigits      = 130;

bool IsDecimalUint64(std::string_view value) {
  if (value.empty() || value.size() > 20) {
    return false;
  }
  std::uint64_t accumulated = 0;
  for (char c : value) {
    if (c < '0' || c > '9') {
      return false;
    }
    const auto digit = static_cast<std::uint64_t>(c - '0');
    if (accumulated > (UINT64_MAX - digit) / 10) {
      return false;
    }
    accumulated = accumulated * 10 + digit;
  }
  return true;
}

/*
  Decode one UTF-8 sequence starting at `pos`, advancing it.

  Rejects overlong forms, surrogates and truncated sequences.
*/
std::optional<std::uint32_t> NextCodePoint(std::string_view text, std::size_t& pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t   length;
  std::uint32_t code_point;
  std::uint32_t minimum;

  if (lead < 0x80) {
    ++pos;
    return lead;
  } else if ((lead & 0xE0) == 0xC0) {
    length     = 2;
    code_point = lead & 0x1F;
    minimum    = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    length     = 3;
    code_point = lead & 0x0F;
    minimum    = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    length     = 4;
    code_point = lead & 0x07;
    minimum    = 0x10000;
  } else {
    return std::nullopt;
  }

  if (pos + length > text.size()) {
    return std::nullopt;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto continuation = static_cast<unsigned char>(text[pos + i]);
    if ((continuation & 0xC0) != 0x80) {
      return std::nullopt;
    }
    code_point = (code_point << 6) | (continuation & 0x3F);
  }

  if (code_point < minimum || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
    return std::nullopt;
  }
  pos += length;
  return code_point;
}

bool IsEmojiCodePoint(std::uint32_t code_point) {
  return (code_point >= 0x2000 && code_point <= 0x2BFF) || (code_point >= 0xE000 && code_point <= 0xFFFF) ||
         (code_point >= 0x1F000 && code_point <= 0x10FFFF);
}

} // namespace

bool IsDsnpUserId(std::string_view value) {
  if (value.substr(0, 2) == "0x") {
    const auto digits = value.substr(2);
    return !digits.empty() && digits.size() <= 16 && util::IsHexDigits(digits);
  }
  return IsDecimalUint64(value);
}

bool IsDsnpAnnouncementId(std::string_view value) {
  if (value.substr(0, kAnnouncementIdScheme.size()) != kAnnouncementIdScheme) {
    return false;
  }
  const auto remainder = value.substr(kAnnouncementIdScheme.size());
  const auto slash     = remainder.find('/');
  if (slash == std::string_view::npos) {
    return false;
  }
  return IsDsnpUserId(remainder.substr(0, slash)) && util::IsPrefixedHex(remainder.substr(slash + 1), kContentHashDigits);
}

bool IsContentHash(std::string_view value) {
  if (value.substr(0, 2) == "0x") {
    value.remove_prefix(2);
  }
  return value.size() == kContentHashDigits && util::IsHexDigits(value);
}

bool IsSignature(std::string_view value) {
  return util::IsPrefixedHex(value, kSignatureDigits);
}

bool IsEmoji(std::string_view value) {
  if (value.empty()) {
    return false;
  }
  std::size_t pos = 0;
  while (pos < value.size()) {
    auto code_point = NextCodePoint(value, pos);
    if (!code_point || !IsEmojiCodePoint(*code_point)) {
      return false;
    }
  }
  return true;
}

} // namespace dsnp::announcement
