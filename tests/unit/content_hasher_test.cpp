#include "internal/crypto/content_hasher.hpp"

#include <arrow/io/memory.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/batch/hashing_output_stream.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "support/test_fixtures.hpp"

namespace {

using dsnp::crypto::ContentHasher;
using dsnp::storage::common::Unwrap;

void TestKnownVectors() {
  if (ContentHasher::IsSupported("KECCAK-256")) {
    assert(dsnp::crypto::HexDigest("") == "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
  }
  assert(dsnp::crypto::HexDigest("abc", "SHA3-256") == "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

void TestIncrementalMatchesOneShot() {
  const auto    digest = dsnp::testing::TestDigest();
  ContentHasher hasher(digest);
  hasher.Update("hello ");
  hasher.Update("");
  hasher.Update("world");
  assert(hasher.bytes_hashed() == 11);
  assert(hasher.HexDigest() == dsnp::crypto::HexDigest("hello world", digest));
}

void TestDigestIsFinalOnce() {
  ContentHasher hasher(dsnp::testing::TestDigest());
  hasher.Update("x");
  hasher.HexDigest();

  bool threw = false;
  try {
    hasher.Update("y");
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownDigestIsRejected() {
  assert(!ContentHasher::IsSupported("NOT-A-DIGEST"));

  bool threw = false;
  try {
    ContentHasher hasher("NOT-A-DIGEST");
  } catch (const dsnp::util::UnsupportedDigest&) {
    threw = true;
  }
  assert(threw);
}

void TestHashingStreamForwardsAndHashesInOrder() {
  const auto    digest = dsnp::testing::TestDigest();
  ContentHasher hasher(digest);

  auto inner   = Unwrap(arrow::io::BufferOutputStream::Create());
  auto hashing = std::make_shared<dsnp::batch::HashingOutputStream>(inner, &hasher);

  Unwrap(hashing->Write("PAR1", 4));
  Unwrap(hashing->Write(arrow::Buffer::FromString("-body-")));
  Unwrap(hashing->Write("PAR1", 4));
  assert(Unwrap(hashing->Tell()) == 14);

  Unwrap(hashing->Close());
  assert(hashing->closed());
  assert(inner->closed());
  // Closing twice is harmless.
  Unwrap(hashing->Close());

  auto written = Unwrap(inner->Finish());
  assert(written->ToString() == "PAR1-body-PAR1");
  assert(hasher.bytes_hashed() == 14);
  assert(hasher.HexDigest() == dsnp::crypto::HexDigest("PAR1-body-PAR1", digest));
}

} // namespace

int main() {
  TestKnownVectors();
  TestIncrementalMatchesOneShot();
  TestDigestIsFinalOnce();
  TestUnknownDigestIsRejected();
  TestHashingStreamForwardsAndHashesInOrder();

  std::cout << "dsnp_unit_content_hasher: pass\n";
  return 0;
}
