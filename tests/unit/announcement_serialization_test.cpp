#include "internal/announcement/serialization.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/announcement/record.hpp"
#include "support/test_fixtures.hpp"

namespace {

using namespace dsnp::announcement;
using dsnp::testing::AnnouncementId;
using dsnp::testing::kContentHash;
using dsnp::testing::Signed;

void TestBroadcastSerializationIsSortedAndDelimiterFree() {
  const auto broadcast = CreateBroadcast("1", "https://example.org/a", "0x12345");
  assert(Serialize(Announcement(broadcast)) == "contentHash0x12345dsnpType2fromId1urlhttps://example.org/a");
}

void TestRecordSerializationMatchesTypedSerialization() {
  Record record;
  record[fields::kUrl]         = std::string("https://example.org/a");
  record[fields::kFromId]      = std::string("1");
  record[fields::kDsnpType]    = std::int64_t{2};
  record[fields::kContentHash] = std::string("0x12345");

  assert(Serialize(record) == Serialize(Announcement(CreateBroadcast("1", "https://example.org/a", "0x12345"))));
}

void TestSignatureIsNotPartOfSigningMaterial() {
  const Announcement reaction = CreateReaction("42", "\xF0\x9F\x91\x8D", AnnouncementId("7"));

  const auto first  = Signed(reaction, "0x" + std::string(130, '1'));
  const auto second = Signed(reaction, "0x" + std::string(130, '2'));
  assert(Serialize(first) == Serialize(second));
  assert(Serialize(first) == Serialize(reaction));
}

void TestReactionFieldOrder() {
  const auto text = Serialize(Announcement(CreateReaction("42", "\xF0\x9F\x91\x8D", "dsnp://7/0xab")));
  assert(text == "dsnpType4emoji\xF0\x9F\x91\x8D" "fromId42inReplyTodsnp://7/0xab");
}

void TestGraphChangeWritesIntegersInDecimal() {
  const auto text = Serialize(Announcement(CreateFollow("42", "99", 1700000000000)));
  assert(text == "changeType1createdAt1700000000000dsnpType1fromId42objectId99");
}

void TestTombstoneSerialization() {
  const auto target    = Signed(CreateBroadcast("42", "https://example.org/p", kContentHash));
  const auto tombstone = CreateTombstone(target, 5);
  assert(tombstone.target_announcement_type == AnnouncementType::kBroadcast);
  assert(tombstone.target_signature == target.signature);

  const auto text = Serialize(Announcement(tombstone));
  assert(text == "createdAt5dsnpType0fromId42targetAnnouncementType2targetSignature" + target.signature);
}

void TestRecordFromJsonFeedsTheSameSerializer() {
  const auto record = RecordFromJson(R"({"url":"https://example.org/a","dsnpType":2,"fromId":"1","contentHash":"0x12345"})");
  assert(std::get<std::int64_t>(record.at(fields::kDsnpType)) == 2);
  assert(Serialize(record) == "contentHash0x12345dsnpType2fromId1urlhttps://example.org/a");
}

} // namespace

int main() {
  TestBroadcastSerializationIsSortedAndDelimiterFree();
  TestRecordSerializationMatchesTypedSerialization();
  TestSignatureIsNotPartOfSigningMaterial();
  TestReactionFieldOrder();
  TestGraphChangeWritesIntegersInDecimal();
  TestTombstoneSerialization();
  TestRecordFromJsonFeedsTheSameSerializer();

  std::cout << "dsnp_unit_announcement_serialization: pass\n";
  return 0;
}
