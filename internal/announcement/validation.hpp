#pragma once

#include "internal/announcement/announcement.hpp"
#include "internal/announcement/record.hpp"

namespace dsnp::announcement {

/*
  Structural validation.

  Validators are fail-fast and throw util::ValidationError naming the first
  field that failed. Checks run in order: the discriminant matches the
  expected type, then each required field passes its format check.

  The dispatching validators throw util::UnknownAnnouncementTypeError for a
  dsnpType outside the enumerated values.
*/

GraphChange ValidateGraphChange(const Record& record);
Broadcast   ValidateBroadcast(const Record& record);
Reply       ValidateReply(const Record& record);
Reaction    ValidateReaction(const Record& record);
Profile     ValidateProfile(const Record& record);
Tombstone   ValidateTombstone(const Record& record);

Announcement       ValidateAnnouncement(const Record& record);
SignedAnnouncement ValidateSignedAnnouncement(const Record& record);

void Validate(const Announcement& announcement);
void Validate(const SignedAnnouncement& announcement);

// Non-throwing forms.
bool IsAnnouncement(const Record& record);
bool IsSignedAnnouncement(const Record& record);

} // namespace dsnp::announcement
