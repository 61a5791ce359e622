#include "internal/content/content.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/announcement/serialization.hpp"
#include "internal/batch/batch_reader.hpp"
#include "internal/crypto/signing.hpp"
#include "internal/storage/memory/memory_content_store.hpp"
#include "internal/util/errors.hpp"
#include "support/test_fixtures.hpp"

namespace {

using namespace dsnp::announcement;
using dsnp::SdkContext;
using dsnp::testing::AnnouncementId;
using dsnp::testing::FakeFetcher;
using dsnp::testing::FakePermissions;
using dsnp::testing::FakeSigner;

constexpr char kIdentity[] = "0xSIGNER";

struct Fixture {
  std::shared_ptr<dsnp::storage::MemoryContentStore> store       = std::make_shared<dsnp::storage::MemoryContentStore>("https://cdn.example.org/");
  std::shared_ptr<FakeSigner>                        signer      = std::make_shared<FakeSigner>(kIdentity);
  std::shared_ptr<FakePermissions>                   permissions = std::make_shared<FakePermissions>();
  std::shared_ptr<FakeFetcher>                       fetcher     = std::make_shared<FakeFetcher>();
  SdkContext                                         context;

  Fixture() {
    permissions->Grant(kIdentity, "42");
    context.store                        = store;
    context.signer                       = signer;
    context.permissions                  = permissions;
    context.batch_options.content_digest = dsnp::testing::TestDigest();
    context.from_id                      = "42";
  }
};

void TestPublishBroadcastStoresContentUnderItsHash() {
  Fixture    f;
  const auto content = std::string(R"({"type":"Note","content":"hello"})");
  const auto hash    = dsnp::crypto::HexDigest(content, dsnp::testing::TestDigest());

  const auto published = dsnp::content::PublishBroadcast(content, f.context);
  const auto& broadcast = std::get<Broadcast>(published.announcement);
  assert(broadcast.from_id == "42");
  assert(broadcast.content_hash == hash);
  assert(broadcast.url == "https://cdn.example.org/" + hash);
  assert(f.store->Get(hash)->ToString() == content);

  // The signature covers the canonical serialization.
  assert(dsnp::crypto::RecoverSigner(published, *f.signer) == kIdentity);
  assert(f.signer->signed_messages() == 1);
}

void TestPublishReplyValidatesTarget() {
  Fixture    f;
  const auto reply = dsnp::content::PublishReply("reply body", AnnouncementId("7"), f.context);
  assert(std::get<Reply>(reply.announcement).in_reply_to == AnnouncementId("7"));

  bool threw = false;
  try {
    dsnp::content::PublishReply("reply body", "dsnp://7/not-a-hash", f.context);
  } catch (const dsnp::util::ValidationError& e) {
    threw = e.field() == fields::kInReplyTo;
  }
  assert(threw);
  // Rejected before anything was stored.
  assert(f.store->Size() == 1);
}

void TestPublishProfileAndReaction() {
  Fixture    f;
  const auto profile = dsnp::content::PublishProfile(R"({"type":"Person","name":"A"})", f.context);
  assert(AnnouncementTypeOf(profile) == AnnouncementType::kProfile);

  const auto reaction = dsnp::content::PublishReaction("\xF0\x9F\x91\x8D", AnnouncementId("7"), f.context);
  assert(AnnouncementTypeOf(reaction) == AnnouncementType::kReaction);
  assert(f.store->Size() == 1);

  bool threw = false;
  try {
    dsnp::content::PublishReaction("+1", AnnouncementId("7"), f.context);
  } catch (const dsnp::util::ValidationError& e) {
    threw = e.field() == fields::kEmoji;
  }
  assert(threw);
}

void TestMissingCollaboratorsAreReported() {
  SdkContext empty;
  bool       threw = false;
  try {
    dsnp::content::PublishBroadcast("x", empty);
  } catch (const dsnp::util::MissingCollaborator&) {
    threw = true;
  }
  assert(threw);

  Fixture f;
  f.context.signer.reset();
  threw = false;
  try {
    dsnp::content::PublishReaction("\xF0\x9F\x91\x8D", AnnouncementId("7"), f.context);
  } catch (const dsnp::util::MissingCollaborator&) {
    threw = true;
  }
  assert(threw);
}

void TestIsValidAnnouncement() {
  Fixture    f;
  const auto published = dsnp::content::PublishBroadcast("body", f.context);
  const auto record    = ToRecord(published);

  assert(dsnp::content::IsValidAnnouncement(record, f.context));

  // Tampered content breaks the signature.
  auto tampered         = record;
  tampered[fields::kUrl] = std::string("https://evil.example.org/x");
  assert(!dsnp::content::IsValidAnnouncement(tampered, f.context));

  // Structurally invalid.
  auto broken = record;
  broken.erase(fields::kFromId);
  assert(!dsnp::content::IsValidAnnouncement(broken, f.context));

  // Signed by someone without permission for this fromId.
  FakePermissions none;
  auto            unauthorized = f.context;
  unauthorized.permissions     = std::make_shared<FakePermissions>(none);
  assert(!dsnp::content::IsValidAnnouncement(record, unauthorized));

  // With a fetcher the content must hash to contentHash.
  const auto& broadcast = std::get<Broadcast>(published.announcement);
  f.context.fetcher     = f.fetcher;
  f.fetcher->Serve(broadcast.url, "body");
  assert(dsnp::content::IsValidAnnouncement(record, f.context));
  f.fetcher->Serve(broadcast.url, "altered body");
  assert(!dsnp::content::IsValidAnnouncement(record, f.context));
}

void TestDefaultContext() {
  Fixture f;
  dsnp::SetDefaultContext(f.context);
  assert(dsnp::DefaultContext()->from_id == "42");

  const auto published = dsnp::content::PublishBroadcast("via default");
  assert(dsnp::content::IsValidAnnouncement(ToRecord(published)));

  std::vector<SignedAnnouncement> rows = {published};
  dsnp::batch::VectorSource       source(rows);
  const auto                      artifact = dsnp::CreateBatch("batches/default.parquet", source);
  assert(artifact.row_count == 1);

  auto reader = dsnp::batch::BatchReader::OpenStored(*f.store, "batches/default.parquet");
  assert(reader->Probe(fields::kFromId, "42"));

  dsnp::SetDefaultContext(SdkContext{});
  bool threw = false;
  try {
    dsnp::content::PublishBroadcast("no store");
  } catch (const dsnp::util::MissingCollaborator&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPublishBroadcastStoresContentUnderItsHash();
  TestPublishReplyValidatesTarget();
  TestPublishProfileAndReaction();
  TestMissingCollaboratorsAreReported();
  TestIsValidAnnouncement();
  TestDefaultContext();

  std::cout << "dsnp_unit_content: pass\n";
  return 0;
}
