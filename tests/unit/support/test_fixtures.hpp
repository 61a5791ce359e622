#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>

#include "internal/announcement/announcement.hpp"
#include "internal/crypto/content_hasher.hpp"
#include "internal/crypto/signer.hpp"

namespace dsnp::testing {

inline const std::string kContentHash = std::string(64, 'a');
inline const std::string kSignature   = "0x" + std::string(130, 'b');

inline std::string AnnouncementId(const std::string& from_id, char fill = 'c') {
  return "dsnp://" + from_id + "/0x" + std::string(64, fill);
}

// OpenSSL < 3.2 ships SHA3 but not the pre-standard Keccak padding.
inline std::string TestDigest() {
  return crypto::ContentHasher::IsSupported(crypto::kDefaultContentDigest) ? crypto::kDefaultContentDigest : "SHA3-256";
}

inline announcement::SignedAnnouncement Signed(announcement::Announcement value, std::string signature = kSignature) {
  return announcement::SignedAnnouncement{std::move(value), std::move(signature)};
}

/*
  Deterministic signer: the signature is derived from the message, and
  RecoverSigner reports `identity` only for signatures it produced.
*/
class FakeSigner final : public crypto::Signer {
 public:
  explicit FakeSigner(std::string identity) : identity_(std::move(identity)) {}

  std::string Sign(std::string_view message) override {
    ++signed_messages_;
    return SignatureFor(message);
  }

  std::string RecoverSigner(std::string_view message, std::string_view signature) const override {
    return signature == SignatureFor(message) ? identity_ : std::string();
  }

  int signed_messages() const {
    return signed_messages_;
  }

 private:
  static std::string SignatureFor(std::string_view message) {
    const auto digest = crypto::HexDigest(message, "SHA256");
    return "0x" + digest + digest + "1b";
  }

  std::string identity_;
  int         signed_messages_{0};
};

class FakePermissions final : public crypto::PermissionResolver {
 public:
  void Grant(const std::string& identity, const std::string& from_id) {
    grants_.emplace(identity, from_id);
  }

  bool IsAuthorized(const std::string& identity, const std::string& from_id, crypto::Permission permission) const override {
    return permission == crypto::Permission::kAnnounce && grants_.count({identity, from_id}) != 0;
  }

 private:
  std::set<std::pair<std::string, std::string>> grants_;
};

class FakeFetcher final : public crypto::ContentFetcher {
 public:
  void Serve(const std::string& url, std::string body) {
    bodies_[url] = std::move(body);
  }

  std::string Fetch(const std::string& url) override {
    return bodies_.at(url);
  }

 private:
  std::map<std::string, std::string> bodies_;
};

} // namespace dsnp::testing
