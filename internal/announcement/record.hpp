#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

#include "internal/announcement/announcement.hpp"

namespace dsnp::announcement {

/*
  Untyped, flat view of an announcement.

  This is the shape announcements have before validation (JSON input,
  decoded batch rows) and the key/value mapping the canonical serializer
  walks. std::map keeps keys in lexicographic order.

  std::monostate marks a field that is present but not a scalar
  (null, boolean, list, object); validators reject it with a type error.
*/
using FieldValue = std::variant<std::monostate, std::int64_t, double, std::string>;
using Record     = std::map<std::string, FieldValue>;

namespace fields {
inline constexpr char kDsnpType[]               = "dsnpType";
inline constexpr char kFromId[]                 = "fromId";
inline constexpr char kChangeType[]             = "changeType";
inline constexpr char kObjectId[]               = "objectId";
inline constexpr char kCreatedAt[]              = "createdAt";
inline constexpr char kUrl[]                    = "url";
inline constexpr char kContentHash[]            = "contentHash";
inline constexpr char kInReplyTo[]              = "inReplyTo";
inline constexpr char kEmoji[]                  = "emoji";
inline constexpr char kTargetAnnouncementType[] = "targetAnnouncementType";
inline constexpr char kTargetSignature[]        = "targetSignature";
inline constexpr char kSignature[]              = "signature";
} // namespace fields

Record ToRecord(const Announcement& announcement);

// Includes the "signature" field.
Record ToRecord(const SignedAnnouncement& announcement);

/*
  Parse a JSON document into a Record.

  Throws ValidationError on field "announcement" when the text is not JSON
  or the document is not an object.
*/
Record RecordFromJson(const std::string& json);

std::string FieldValueToString(const FieldValue& value);

} // namespace dsnp::announcement
