#pragma once

#include <string>
#include <string_view>

#include "internal/announcement/announcement.hpp"
#include "internal/announcement/record.hpp"
#include "internal/context/sdk_context.hpp"

namespace dsnp::content {

/*
  Content publishing.

  Broadcast, Reply and Profile take already-serialized activity content.
  The content is hashed, stored under its hash in the context's content
  store, and the resulting URL and hash are announced for the context's
  from_id. Reactions carry no content and are only created and signed.

  Every announcement is structurally validated before it is signed.
*/

announcement::SignedAnnouncement PublishBroadcast(std::string_view content, const SdkContext& context);
announcement::SignedAnnouncement PublishBroadcast(std::string_view content);

announcement::SignedAnnouncement PublishReply(std::string_view content, const std::string& in_reply_to, const SdkContext& context);
announcement::SignedAnnouncement PublishReply(std::string_view content, const std::string& in_reply_to);

announcement::SignedAnnouncement PublishProfile(std::string_view content, const SdkContext& context);
announcement::SignedAnnouncement PublishProfile(std::string_view content);

announcement::SignedAnnouncement PublishReaction(const std::string& emoji, const std::string& in_reply_to, const SdkContext& context);
announcement::SignedAnnouncement PublishReaction(const std::string& emoji, const std::string& in_reply_to);

/*
  Full acceptance check for a received announcement:

    1. structure (false on any ValidationError)
    2. signer recovered from the canonical bytes may announce for fromId
    3. with a content fetcher configured, Broadcast / Reply content at
       `url` hashes to `contentHash`

  Collaborator failures propagate.
*/
bool IsValidAnnouncement(const announcement::Record& record, const SdkContext& context);
bool IsValidAnnouncement(const announcement::Record& record);

} // namespace dsnp::content
