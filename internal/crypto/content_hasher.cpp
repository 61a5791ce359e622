#include "internal/crypto/content_hasher.hpp"

#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace dsnp::crypto {

ContentHasher::ContentHasher(std::string digest_name)
    : digest_name_(std::move(digest_name)),
      md_(EVP_MD_fetch(nullptr, digest_name_.c_str(), nullptr), EVP_MD_free),
      ctx_(EVP_MD_CTX_new(), EVP_MD_CTX_free) {
  if (!md_) {
    throw util::UnsupportedDigest(digest_name_);
  }
  if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), md_.get(), nullptr) != 1) {
    throw std::runtime_error("failed to initialize digest " + digest_name_);
  }
}

void ContentHasher::Update(const void* data, std::size_t size) {
  if (finished_) {
    throw std::logic_error("digest already finished");
  }
  if (size == 0) {
    return;
  }
  if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw std::runtime_error("digest update failed for " + digest_name_);
  }
  bytes_hashed_ += size;
}

std::string ContentHasher::HexDigest() {
  if (finished_) {
    throw std::logic_error("digest already finished");
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  length = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
    throw std::runtime_error("digest finalization failed for " + digest_name_);
  }
  finished_ = true;
  return util::HexEncode(digest, length);
}

bool ContentHasher::IsSupported(const std::string& digest_name) {
  EVP_MD* md = EVP_MD_fetch(nullptr, digest_name.c_str(), nullptr);
  if (md == nullptr) {
    return false;
  }
  EVP_MD_free(md);
  return true;
}

std::string HexDigest(std::string_view data, const std::string& digest_name) {
  ContentHasher hasher(digest_name);
  hasher.Update(data);
  return hasher.HexDigest();
}

} // namespace dsnp::crypto
