#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace dsnp::crypto {

inline constexpr char kDefaultContentDigest[] = "KECCAK-256";

/*
  Incremental digest over a byte stream, backed by an OpenSSL EVP digest.

  The default algorithm is Keccak-256 (the pre-standard SHA-3 padding used
  across DSNP). Any digest name the OpenSSL default provider knows can be
  configured instead.

  HexDigest() may be called once; Update() after HexDigest() throws.
*/
class ContentHasher {
 public:
  explicit ContentHasher(std::string digest_name = kDefaultContentDigest);

  ContentHasher(const ContentHasher&)            = delete;
  ContentHasher& operator=(const ContentHasher&) = delete;
  ContentHasher(ContentHasher&&)                 = default;
  ContentHasher& operator=(ContentHasher&&)      = default;

  void Update(const void* data, std::size_t size);
  void Update(std::string_view data) {
    Update(data.data(), data.size());
  }

  // Lowercase hex digest without a 0x prefix.
  std::string HexDigest();

  std::uint64_t bytes_hashed() const {
    return bytes_hashed_;
  }

  const std::string& digest_name() const {
    return digest_name_;
  }

  static bool IsSupported(const std::string& digest_name);

 private:
  using evp_md_ptr     = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
  using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

  std::string    digest_name_;
  evp_md_ptr     md_;
  evp_md_ctx_ptr ctx_;
  std::uint64_t  bytes_hashed_{0};
  bool           finished_{false};
};

// One-shot helper.
std::string HexDigest(std::string_view data, const std::string& digest_name = kDefaultContentDigest);

} // namespace dsnp::crypto
