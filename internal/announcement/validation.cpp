#include "internal/announcement/validation.hpp"

#include <cstdint>
#include <string>

#include "internal/announcement/identifiers.hpp"
#include "internal/util/errors.hpp"

namespace dsnp::announcement {

using util::ValidationError;

namespace {

const FieldValue& RequireField(const Record& record, const char* field) {
  auto it = record.find(field);
  if (it == record.end()) {
    throw ValidationError(field, "missing");
  }
  return it->second;
}

std::int64_t RequireInteger(const Record& record, const char* field) {
  const auto& value = RequireField(record, field);
  if (const auto* integer = std::get_if<std::int64_t>(&value)) {
    return *integer;
  }
  throw ValidationError(field, "must be an integer");
}

const std::string& RequireString(const Record& record, const char* field) {
  const auto& value = RequireField(record, field);
  if (const auto* text = std::get_if<std::string>(&value)) {
    return *text;
  }
  throw ValidationError(field, "must be a string");
}

void RequireType(const Record& record, AnnouncementType expected) {
  const auto actual = RequireInteger(record, fields::kDsnpType);
  if (actual != static_cast<std::int64_t>(expected)) {
    throw ValidationError(fields::kDsnpType, "expected " + std::to_string(static_cast<std::int32_t>(expected)) + " (" +
                                                 AnnouncementTypeName(expected) + "), got " + std::to_string(actual));
  }
}

std::string RequireUserId(const Record& record, const char* field) {
  const auto& value = RequireString(record, field);
  if (!IsDsnpUserId(value)) {
    throw ValidationError(field, "not a DSNP user id");
  }
  return value;
}

std::string RequireAnnouncementId(const Record& record, const char* field) {
  const auto& value = RequireString(record, field);
  if (!IsDsnpAnnouncementId(value)) {
    throw ValidationError(field, "not a DSNP announcement id");
  }
  return value;
}

std::string RequireContentHash(const Record& record, const char* field) {
  const auto& value = RequireString(record, field);
  if (!IsContentHash(value)) {
    throw ValidationError(field, "not a 32-byte hex content hash");
  }
  return value;
}

std::string RequireSignature(const Record& record, const char* field) {
  const auto& value = RequireString(record, field);
  if (!IsSignature(value)) {
    throw ValidationError(field, "not a 65-byte hex signature");
  }
  return value;
}

std::string RequireUrl(const Record& record, const char* field) {
  const auto& value = RequireString(record, field);
  if (value.empty()) {
    throw ValidationError(field, "must not be empty");
  }
  return value;
}

std::string RequireEmoji(const Record& record, const char* field) {
  const auto& value = RequireString(record, field);
  if (!IsEmoji(value)) {
    throw ValidationError(field, "contains characters outside the emoji ranges");
  }
  return value;
}

std::int64_t RequireTimestamp(const Record& record, const char* field) {
  const auto value = RequireInteger(record, field);
  if (value < 0) {
    throw ValidationError(field, "must not be negative");
  }
  return value;
}

GraphChangeType RequireGraphChangeType(const Record& record, const char* field) {
  const auto value = RequireInteger(record, field);
  switch (value) {
    case static_cast<std::int64_t>(GraphChangeType::kUnfollow):
      return GraphChangeType::kUnfollow;
    case static_cast<std::int64_t>(GraphChangeType::kFollow):
      return GraphChangeType::kFollow;
    default:
      throw ValidationError(field, "unknown graph change type " + std::to_string(value));
  }
}

AnnouncementType RequireTombstoneTarget(const Record& record, const char* field) {
  const auto value = RequireInteger(record, field);
  switch (value) {
    case static_cast<std::int64_t>(AnnouncementType::kBroadcast):
      return AnnouncementType::kBroadcast;
    case static_cast<std::int64_t>(AnnouncementType::kReply):
      return AnnouncementType::kReply;
    case static_cast<std::int64_t>(AnnouncementType::kReaction):
      return AnnouncementType::kReaction;
    default:
      throw ValidationError(field, "announcement type " + std::to_string(value) + " cannot be tombstoned");
  }
}

} // namespace

// ------------------------------------------------------------------
// Per-type validators
// ------------------------------------------------------------------

GraphChange ValidateGraphChange(const Record& record) {
  RequireType(record, GraphChange::kType);
  GraphChange value;
  value.from_id     = RequireUserId(record, fields::kFromId);
  value.change_type = RequireGraphChangeType(record, fields::kChangeType);
  value.object_id   = RequireUserId(record, fields::kObjectId);
  value.created_at  = RequireTimestamp(record, fields::kCreatedAt);
  return value;
}

Broadcast ValidateBroadcast(const Record& record) {
  RequireType(record, Broadcast::kType);
  Broadcast value;
  value.from_id      = RequireUserId(record, fields::kFromId);
  value.url          = RequireUrl(record, fields::kUrl);
  value.content_hash = RequireContentHash(record, fields::kContentHash);
  return value;
}

Reply ValidateReply(const Record& record) {
  RequireType(record, Reply::kType);
  Reply value;
  value.from_id      = RequireUserId(record, fields::kFromId);
  value.url          = RequireUrl(record, fields::kUrl);
  value.content_hash = RequireContentHash(record, fields::kContentHash);
  value.in_reply_to  = RequireAnnouncementId(record, fields::kInReplyTo);
  return value;
}

Reaction ValidateReaction(const Record& record) {
  RequireType(record, Reaction::kType);
  Reaction value;
  value.from_id     = RequireUserId(record, fields::kFromId);
  value.emoji       = RequireEmoji(record, fields::kEmoji);
  value.in_reply_to = RequireAnnouncementId(record, fields::kInReplyTo);
  return value;
}

Profile ValidateProfile(const Record& record) {
  RequireType(record, Profile::kType);
  Profile value;
  value.from_id      = RequireUserId(record, fields::kFromId);
  value.url          = RequireUrl(record, fields::kUrl);
  value.content_hash = RequireContentHash(record, fields::kContentHash);
  return value;
}

Tombstone ValidateTombstone(const Record& record) {
  RequireType(record, Tombstone::kType);
  Tombstone value;
  value.from_id                  = RequireUserId(record, fields::kFromId);
  value.created_at               = RequireTimestamp(record, fields::kCreatedAt);
  value.target_announcement_type = RequireTombstoneTarget(record, fields::kTargetAnnouncementType);
  value.target_signature         = RequireSignature(record, fields::kTargetSignature);
  return value;
}

// ------------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------------

Announcement ValidateAnnouncement(const Record& record) {
  const auto type = RequireInteger(record, fields::kDsnpType);
  switch (type) {
    case static_cast<std::int64_t>(AnnouncementType::kTombstone):
      return ValidateTombstone(record);
    case static_cast<std::int64_t>(AnnouncementType::kGraphChange):
      return ValidateGraphChange(record);
    case static_cast<std::int64_t>(AnnouncementType::kBroadcast):
      return ValidateBroadcast(record);
    case static_cast<std::int64_t>(AnnouncementType::kReply):
      return ValidateReply(record);
    case static_cast<std::int64_t>(AnnouncementType::kReaction):
      return ValidateReaction(record);
    case static_cast<std::int64_t>(AnnouncementType::kProfile):
      return ValidateProfile(record);
    default:
      throw util::UnknownAnnouncementTypeError(type);
  }
}

SignedAnnouncement ValidateSignedAnnouncement(const Record& record) {
  SignedAnnouncement signed_announcement;
  signed_announcement.signature    = RequireSignature(record, fields::kSignature);
  signed_announcement.announcement = ValidateAnnouncement(record);
  return signed_announcement;
}

void Validate(const Announcement& announcement) {
  (void)ValidateAnnouncement(ToRecord(announcement));
}

void Validate(const SignedAnnouncement& announcement) {
  (void)ValidateSignedAnnouncement(ToRecord(announcement));
}

bool IsAnnouncement(const Record& record) {
  try {
    (void)ValidateAnnouncement(record);
    return true;
  } catch (const ValidationError&) {
    return false;
  }
}

bool IsSignedAnnouncement(const Record& record) {
  try {
    (void)ValidateSignedAnnouncement(record);
    return true;
  } catch (const ValidationError&) {
    return false;
  }
}

} // namespace dsnp::announcement
