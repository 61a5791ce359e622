#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace dsnp::announcement {

/*
  DSNP announcement model.

  An Announcement is a closed sum over the six announcement kinds. The
  integer discriminant is serialized under the key "dsnpType".
*/

enum class AnnouncementType : std::int32_t {
  kTombstone   = 0,
  kGraphChange = 1,
  kBroadcast   = 2,
  kReply       = 3,
  kReaction    = 4,
  kProfile     = 5,
};

enum class GraphChangeType : std::int32_t {
  kUnfollow = 0,
  kFollow   = 1,
};

struct GraphChange {
  static constexpr AnnouncementType kType = AnnouncementType::kGraphChange;

  std::string     from_id;
  GraphChangeType change_type = GraphChangeType::kFollow;
  std::string     object_id;
  std::int64_t    created_at = 0;
};

struct Broadcast {
  static constexpr AnnouncementType kType = AnnouncementType::kBroadcast;

  std::string from_id;
  std::string url;
  std::string content_hash;
};

struct Reply {
  static constexpr AnnouncementType kType = AnnouncementType::kReply;

  std::string from_id;
  std::string url;
  std::string content_hash;
  std::string in_reply_to;
};

struct Reaction {
  static constexpr AnnouncementType kType = AnnouncementType::kReaction;

  std::string from_id;
  std::string emoji;
  std::string in_reply_to;
};

struct Profile {
  static constexpr AnnouncementType kType = AnnouncementType::kProfile;

  std::string from_id;
  std::string url;
  std::string content_hash;
};

struct Tombstone {
  static constexpr AnnouncementType kType = AnnouncementType::kTombstone;

  std::string      from_id;
  std::int64_t     created_at = 0;
  AnnouncementType target_announcement_type = AnnouncementType::kBroadcast;
  std::string      target_signature;
};

using Announcement = std::variant<GraphChange, Broadcast, Reply, Reaction, Profile, Tombstone>;

/*
  An announcement together with the signature over its canonical
  serialization. Built once after signing and not modified afterwards.
*/
struct SignedAnnouncement {
  Announcement announcement;
  std::string  signature;
};

bool operator==(const GraphChange& lhs, const GraphChange& rhs);
bool operator==(const Broadcast& lhs, const Broadcast& rhs);
bool operator==(const Reply& lhs, const Reply& rhs);
bool operator==(const Reaction& lhs, const Reaction& rhs);
bool operator==(const Profile& lhs, const Profile& rhs);
bool operator==(const Tombstone& lhs, const Tombstone& rhs);
bool operator==(const SignedAnnouncement& lhs, const SignedAnnouncement& rhs);

AnnouncementType AnnouncementTypeOf(const Announcement& announcement);
AnnouncementType AnnouncementTypeOf(const SignedAnnouncement& announcement);

const std::string& FromIdOf(const Announcement& announcement);

std::string AnnouncementTypeName(AnnouncementType type);

// ------------------------------------------------------------------
// Factories
// ------------------------------------------------------------------
/*
  Factories build typed values without validating them; run Validate()
  before trusting input that did not originate in this process.
*/

GraphChange CreateGraphChange(std::string from_id, GraphChangeType change_type, std::string object_id, std::int64_t created_at);
GraphChange CreateFollow(std::string from_id, std::string object_id, std::int64_t created_at);
GraphChange CreateUnfollow(std::string from_id, std::string object_id, std::int64_t created_at);
Broadcast   CreateBroadcast(std::string from_id, std::string url, std::string content_hash);
Reply       CreateReply(std::string from_id, std::string url, std::string content_hash, std::string in_reply_to);
Reaction    CreateReaction(std::string from_id, std::string emoji, std::string in_reply_to);
Profile     CreateProfile(std::string from_id, std::string url, std::string content_hash);
Tombstone   CreateTombstone(std::string from_id, std::int64_t created_at, AnnouncementType target_type, std::string target_signature);

// Tombstone for a previously signed announcement.
Tombstone CreateTombstone(const SignedAnnouncement& target, std::int64_t created_at);

} // namespace dsnp::announcement
