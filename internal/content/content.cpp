#include "internal/content/content.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "internal/announcement/identifiers.hpp"
#include "internal/announcement/validation.hpp"
#include "internal/crypto/content_hasher.hpp"
#include "internal/crypto/signing.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dsnp::content {

using announcement::SignedAnnouncement;

namespace {

struct StoredContent {
  std::string url;
  std::string hash;
};

StoredContent StoreContent(std::string_view content, const SdkContext& context) {
  auto& store = RequireStore(context);

  StoredContent stored;
  stored.hash = crypto::HexDigest(content, context.batch_options.content_digest);
  stored.url  = store.Put(stored.hash, content);

  DSNP_LOG_DEBUG("content stored", {observability::StringField("url", stored.url), observability::StringField("hash", stored.hash),
                                    observability::IntField("bytes", static_cast<std::int64_t>(content.size()))});
  return stored;
}

SignedAnnouncement ValidateAndSign(const announcement::Announcement& value, const SdkContext& context) {
  announcement::Validate(value);
  return crypto::Sign(value, RequireSigner(context));
}

std::string NormalizeHash(std::string hash) {
  if (hash.size() > 2 && hash[0] == '0' && (hash[1] == 'x' || hash[1] == 'X')) {
    hash.erase(0, 2);
  }
  std::transform(hash.begin(), hash.end(), hash.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return hash;
}

bool ContentMatches(const std::string& url, const std::string& content_hash, const SdkContext& context) {
  const auto body   = context.fetcher->Fetch(url);
  const auto actual = crypto::HexDigest(body, context.batch_options.content_digest);
  if (actual == NormalizeHash(content_hash)) {
    return true;
  }
  DSNP_LOG_DEBUG("content hash mismatch", {observability::StringField("url", url), observability::StringField("expected", content_hash),
                                           observability::StringField("actual", actual)});
  return false;
}

} // namespace

// ------------------------------------------------------------------
// Publishing
// ------------------------------------------------------------------

SignedAnnouncement PublishBroadcast(std::string_view content, const SdkContext& context) {
  const auto& from_id = RequireFromId(context);
  RequireSigner(context);

  auto stored = StoreContent(content, context);
  return ValidateAndSign(announcement::CreateBroadcast(from_id, std::move(stored.url), std::move(stored.hash)), context);
}

SignedAnnouncement PublishReply(std::string_view content, const std::string& in_reply_to, const SdkContext& context) {
  if (!announcement::IsDsnpAnnouncementId(in_reply_to)) {
    throw util::ValidationError(announcement::fields::kInReplyTo, "not a DSNP announcement id");
  }
  const auto& from_id = RequireFromId(context);
  RequireSigner(context);

  auto stored = StoreContent(content, context);
  return ValidateAndSign(announcement::CreateReply(from_id, std::move(stored.url), std::move(stored.hash), in_reply_to), context);
}

SignedAnnouncement PublishProfile(std::string_view content, const SdkContext& context) {
  const auto& from_id = RequireFromId(context);
  RequireSigner(context);

  auto stored = StoreContent(content, context);
  return ValidateAndSign(announcement::CreateProfile(from_id, std::move(stored.url), std::move(stored.hash)), context);
}

SignedAnnouncement PublishReaction(const std::string& emoji, const std::string& in_reply_to, const SdkContext& context) {
  return ValidateAndSign(announcement::CreateReaction(RequireFromId(context), emoji, in_reply_to), context);
}

SignedAnnouncement PublishBroadcast(std::string_view content) {
  return PublishBroadcast(content, *DefaultContext());
}

SignedAnnouncement PublishReply(std::string_view content, const std::string& in_reply_to) {
  return PublishReply(content, in_reply_to, *DefaultContext());
}

SignedAnnouncement PublishProfile(std::string_view content) {
  return PublishProfile(content, *DefaultContext());
}

SignedAnnouncement PublishReaction(const std::string& emoji, const std::string& in_reply_to) {
  return PublishReaction(emoji, in_reply_to, *DefaultContext());
}

// ------------------------------------------------------------------
// Acceptance
// ------------------------------------------------------------------

bool IsValidAnnouncement(const announcement::Record& record, const SdkContext& context) {
  SignedAnnouncement signed_announcement;
  try {
    signed_announcement = announcement::ValidateSignedAnnouncement(record);
  } catch (const util::ValidationError& e) {
    DSNP_LOG_DEBUG("announcement rejected", {observability::StringField("field", e.field()), observability::StringField("error", e.what())});
    return false;
  }

  if (!crypto::IsSignatureAuthorizedTo(signed_announcement, RequireSigner(context), RequirePermissions(context),
                                       crypto::Permission::kAnnounce)) {
    return false;
  }

  if (!context.fetcher) {
    return true;
  }

  if (const auto* broadcast = std::get_if<announcement::Broadcast>(&signed_announcement.announcement)) {
    return ContentMatches(broadcast->url, broadcast->content_hash, context);
  }
  if (const auto* reply = std::get_if<announcement::Reply>(&signed_announcement.announcement)) {
    return ContentMatches(reply->url, reply->content_hash, context);
  }
  return true;
}

bool IsValidAnnouncement(const announcement::Record& record) {
  return IsValidAnnouncement(record, *DefaultContext());
}

} // namespace dsnp::content
