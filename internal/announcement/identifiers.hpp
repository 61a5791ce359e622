#pragma once

#include <string_view>

namespace dsnp::announcement {

/*
  Format checks for the identifier-like strings carried by announcements.
*/

// Decimal uint64 ("42") or 0x-prefixed hex of 1..16 digits ("0x2a").
bool IsDsnpUserId(std::string_view value);

// dsnp://<user id>/0x<64 hex digits>
bool IsDsnpAnnouncementId(std::string_view value);

// 64 hex digits, optionally 0x-prefixed.
bool IsContentHash(std::string_view value);

// 0x followed by 130 hex digits (65-byte secp256k1 signature).
bool IsSignature(std::string_view value);

// Non-empty UTF-8 made only of code points in the emoji ranges.
bool IsEmoji(std::string_view value);

} // namespace dsnp::announcement
