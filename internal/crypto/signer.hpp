#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace dsnp::crypto {

/*
  Collaborator interfaces.

  The SDK never touches key material or the network. Signing, identity
  resolution and content download are supplied by the embedding
  application through these interfaces.
*/

class Signer {
 public:
  virtual ~Signer() = default;

  // Signature over `message`, 0x-prefixed hex.
  virtual std::string Sign(std::string_view message) = 0;

  // Identity (e.g. an account address) that produced `signature`.
  virtual std::string RecoverSigner(std::string_view message, std::string_view signature) const = 0;
};

enum class Permission {
  kAnnounce,
  kOwnershipTransfer,
  kDelegateAdd,
  kDelegateRemove,
};

class PermissionResolver {
 public:
  virtual ~PermissionResolver() = default;

  // Whether `identity` may currently act for DSNP user `from_id`.
  virtual bool IsAuthorized(const std::string& identity, const std::string& from_id, Permission permission) const = 0;
};

class ContentFetcher {
 public:
  virtual ~ContentFetcher() = default;

  virtual std::string Fetch(const std::string& url) = 0;
};

using SignerPtr             = std::shared_ptr<Signer>;
using PermissionResolverPtr = std::shared_ptr<PermissionResolver>;
using ContentFetcherPtr     = std::shared_ptr<ContentFetcher>;

} // namespace dsnp::crypto
