#include "internal/announcement/announcement.hpp"

#include <string>
#include <type_traits>
#include <utility>

namespace dsnp::announcement {

bool operator==(const GraphChange& lhs, const GraphChange& rhs) {
  return lhs.from_id == rhs.from_id && lhs.change_type == rhs.change_type && lhs.object_id == rhs.object_id &&
         lhs.created_at == rhs.created_at;
}

bool operator==(const Broadcast& lhs, const Broadcast& rhs) {
  return lhs.from_id == rhs.from_id && lhs.url == rhs.url && lhs.content_hash == rhs.content_hash;
}

bool operator==(const Reply& lhs, const Reply& rhs) {
  return lhs.from_id == rhs.from_id && lhs.url == rhs.url && lhs.content_hash == rhs.content_hash &&
         lhs.in_reply_to == rhs.in_reply_to;
}

bool operator==(const Reaction& lhs, const Reaction& rhs) {
  return lhs.from_id == rhs.from_id && lhs.emoji == rhs.emoji && lhs.in_reply_to == rhs.in_reply_to;
}

bool operator==(const Profile& lhs, const Profile& rhs) {
  return lhs.from_id == rhs.from_id && lhs.url == rhs.url && lhs.content_hash == rhs.content_hash;
}

bool operator==(const Tombstone& lhs, const Tombstone& rhs) {
  return lhs.from_id == rhs.from_id && lhs.created_at == rhs.created_at &&
         lhs.target_announcement_type == rhs.target_announcement_type && lhs.target_signature == rhs.target_signature;
}

bool operator==(const SignedAnnouncement& lhs, const SignedAnnouncement& rhs) {
  return lhs.signature == rhs.signature && lhs.announcement == rhs.announcement;
}

AnnouncementType AnnouncementTypeOf(const Announcement& announcement) {
  return std::visit([](const auto& value) { return std::decay_t<decltype(value)>::kType; }, announcement);
}

AnnouncementType AnnouncementTypeOf(const SignedAnnouncement& announcement) {
  return AnnouncementTypeOf(announcement.announcement);
}

const std::string& FromIdOf(const Announcement& announcement) {
  return std::visit([](const auto& value) -> const std::string& { return value.from_id; }, announcement);
}

std::string AnnouncementTypeName(AnnouncementType type) {
  switch (type) {
    case AnnouncementType::kTombstone:
      return "Tombstone";
    case AnnouncementType::kGraphChange:
      return "GraphChange";
    case AnnouncementType::kBroadcast:
      return "Broadcast";
    case AnnouncementType::kReply:
      return "Reply";
    case AnnouncementType::kReaction:
      return "Reaction";
    case AnnouncementType::kProfile:
      return "Profile";
  }
  return "Unknown(" + std::to_string(static_cast<std::int32_t>(type)) + ")";
}

// ------------------------------------------------------------------
// Factories
// ------------------------------------------------------------------

GraphChange CreateGraphChange(std::string from_id, GraphChangeType change_type, std::string object_id, std::int64_t created_at) {
  return GraphChange{std::move(from_id), change_type, std::move(object_id), created_at};
}

GraphChange CreateFollow(std::string from_id, std::string object_id, std::int64_t created_at) {
  return CreateGraphChange(std::move(from_id), GraphChangeType::kFollow, std::move(object_id), created_at);
}

GraphChange CreateUnfollow(std::string from_id, std::string object_id, std::int64_t created_at) {
  return CreateGraphChange(std::move(from_id), GraphChangeType::kUnfollow, std::move(object_id), created_at);
}

Broadcast CreateBroadcast(std::string from_id, std::string url, std::string content_hash) {
  return Broadcast{std::move(from_id), std::move(url), std::move(content_hash)};
}

Reply CreateReply(std::string from_id, std::string url, std::string content_hash, std::string in_reply_to) {
  return Reply{std::move(from_id), std::move(url), std::move(content_hash), std::move(in_reply_to)};
}

Reaction CreateReaction(std::string from_id, std::string emoji, std::string in_reply_to) {
  return Reaction{std::move(from_id), std::move(emoji), std::move(in_reply_to)};
}

Profile CreateProfile(std::string from_id, std::string url, std::string content_hash) {
  return Profile{std::move(from_id), std::move(url), std::move(content_hash)};
}

Tombstone CreateTombstone(std::string from_id, std::int64_t created_at, AnnouncementType target_type, std::string target_signature) {
  return Tombstone{std::move(from_id), created_at, target_type, std::move(target_signature)};
}

Tombstone CreateTombstone(const SignedAnnouncement& target, std::int64_t created_at) {
  return CreateTombstone(FromIdOf(target.announcement), created_at, AnnouncementTypeOf(target), target.signature);
}

} // namespace dsnp::announcement
