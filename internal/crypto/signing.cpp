#include "internal/crypto/signing.hpp"

#include "internal/announcement/serialization.hpp"

namespace dsnp::crypto {

using announcement::SignedAnnouncement;

SignedAnnouncement Sign(const announcement::Announcement& announcement, Signer& signer) {
  SignedAnnouncement signed_announcement;
  signed_announcement.announcement = announcement;
  signed_announcement.signature    = signer.Sign(announcement::Serialize(announcement));
  return signed_announcement;
}

std::string RecoverSigner(const SignedAnnouncement& announcement, const Signer& signer) {
  return signer.RecoverSigner(announcement::Serialize(announcement), announcement.signature);
}

bool IsSignatureAuthorizedTo(const SignedAnnouncement& announcement, const Signer& signer, const PermissionResolver& permissions,
                             Permission permission) {
  const auto identity = RecoverSigner(announcement, signer);
  if (identity.empty()) {
    return false;
  }
  return permissions.IsAuthorized(identity, announcement::FromIdOf(announcement.announcement), permission);
}

} // namespace dsnp::crypto
