#pragma once

#include <string>

#include "internal/announcement/announcement.hpp"
#include "internal/announcement/record.hpp"

namespace dsnp::announcement {

/*
  Canonical serialization used as signing material.

  Fields are sorted by key and concatenated as key || value with no
  delimiters or escaping; integers are written in decimal. Signatures only
  verify against this exact byte layout.

      CreateBroadcast("1", "https://example.org/a", "0x12345")
        -> "contentHash0x12345dsnpType2fromId1urlhttps://example.org/a"
*/
std::string Serialize(const Record& record);
std::string Serialize(const Announcement& announcement);

// The signature is not part of its own signing material.
std::string Serialize(const SignedAnnouncement& announcement);

} // namespace dsnp::announcement
