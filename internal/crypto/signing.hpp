#pragma once

#include <string>

#include "internal/announcement/announcement.hpp"
#include "internal/crypto/signer.hpp"

namespace dsnp::crypto {

// Sign the canonical serialization of `announcement`.
announcement::SignedAnnouncement Sign(const announcement::Announcement& announcement, Signer& signer);

std::string RecoverSigner(const announcement::SignedAnnouncement& announcement, const Signer& signer);

/*
  True when the identity recovered from the signature is authorized to act
  for the announcement's fromId with `permission`. Collaborator failures
  propagate.
*/
bool IsSignatureAuthorizedTo(const announcement::SignedAnnouncement& announcement, const Signer& signer,
                             const PermissionResolver& permissions, Permission permission);

} // namespace dsnp::crypto
