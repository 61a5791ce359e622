#include "internal/announcement/validation.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/announcement/identifiers.hpp"
#include "internal/util/errors.hpp"
#include "support/test_fixtures.hpp"

namespace {

using namespace dsnp::announcement;
using dsnp::testing::AnnouncementId;
using dsnp::testing::kContentHash;
using dsnp::testing::kSignature;
using dsnp::testing::Signed;
using dsnp::util::UnknownAnnouncementTypeError;
using dsnp::util::ValidationError;

Record BroadcastRecord() {
  return ToRecord(Announcement(CreateBroadcast("42", "https://example.org/post", kContentHash)));
}

// Field name carried by the ValidationError `record` raises, or "" when it validates.
std::string FailingField(const Record& record) {
  try {
    ValidateAnnouncement(record);
  } catch (const ValidationError& e) {
    return e.field();
  }
  return "";
}

void TestEveryFactoryProducesAValidAnnouncement() {
  Validate(Announcement(CreateFollow("42", "99", 1700000000000)));
  Validate(Announcement(CreateUnfollow("0x2a", "99", 0)));
  Validate(Announcement(CreateBroadcast("42", "https://example.org/post", kContentHash)));
  Validate(Announcement(CreateReply("42", "https://example.org/reply", "0x" + kContentHash, AnnouncementId("7"))));
  Validate(Announcement(CreateReaction("42", "\xF0\x9F\x91\x8D", AnnouncementId("7"))));
  Validate(Announcement(CreateProfile("42", "https://example.org/profile", kContentHash)));
  Validate(Announcement(CreateTombstone("42", 1, AnnouncementType::kReaction, kSignature)));
}

void TestTypedValidatorsReturnTheTypedValue() {
  const auto broadcast = ValidateBroadcast(BroadcastRecord());
  assert(broadcast.from_id == "42");
  assert(broadcast.url == "https://example.org/post");
  assert(broadcast.content_hash == kContentHash);

  const auto dispatched = ValidateAnnouncement(BroadcastRecord());
  assert(std::holds_alternative<Broadcast>(dispatched));
}

void TestMissingAndMistypedFields() {
  auto record = BroadcastRecord();
  record.erase(fields::kUrl);
  assert(FailingField(record) == fields::kUrl);

  record                   = BroadcastRecord();
  record[fields::kFromId]  = std::int64_t{42};
  assert(FailingField(record) == fields::kFromId);

  record                        = BroadcastRecord();
  record[fields::kContentHash]  = std::string("0x12345");
  assert(FailingField(record) == fields::kContentHash);

  record = BroadcastRecord();
  record.erase(fields::kDsnpType);
  assert(FailingField(record) == fields::kDsnpType);
}

void TestWrongDiscriminantForTypedValidator() {
  bool threw = false;
  try {
    ValidateReply(BroadcastRecord());
  } catch (const ValidationError& e) {
    threw = true;
    assert(e.field() == fields::kDsnpType);
  }
  assert(threw);
}

void TestUnknownTypeValue() {
  auto record                = BroadcastRecord();
  record[fields::kDsnpType]  = std::int64_t{99};

  bool threw = false;
  try {
    ValidateAnnouncement(record);
  } catch (const UnknownAnnouncementTypeError& e) {
    threw = true;
    assert(e.value() == 99);
    assert(e.field() == fields::kDsnpType);
  }
  assert(threw);
  assert(!IsAnnouncement(record));
}

void TestGraphChangeRules() {
  auto record = ToRecord(Announcement(CreateFollow("42", "99", 1)));
  record[fields::kChangeType] = std::int64_t{7};
  assert(FailingField(record) == fields::kChangeType);

  record = ToRecord(Announcement(CreateFollow("42", "99", 1)));
  record[fields::kCreatedAt] = std::int64_t{-1};
  assert(FailingField(record) == fields::kCreatedAt);

  record = ToRecord(Announcement(CreateFollow("42", "not-a-user", 1)));
  assert(FailingField(record) == fields::kObjectId);
}

void TestReactionRejectsNonEmoji() {
  auto record = ToRecord(Announcement(CreateReaction("42", "ok", AnnouncementId("7"))));
  assert(FailingField(record) == fields::kEmoji);

  record = ToRecord(Announcement(CreateReaction("42", "\xF0\x9F\x91\x8D", "dsnp://7/0x12")));
  assert(FailingField(record) == fields::kInReplyTo);
}

void TestTombstoneTargetRules() {
  auto record = ToRecord(Announcement(CreateTombstone("42", 1, AnnouncementType::kTombstone, kSignature)));
  assert(FailingField(record) == fields::kTargetAnnouncementType);

  record = ToRecord(Announcement(CreateTombstone("42", 1, AnnouncementType::kGraphChange, kSignature)));
  assert(FailingField(record) == fields::kTargetAnnouncementType);

  record = ToRecord(Announcement(CreateTombstone("42", 1, AnnouncementType::kBroadcast, "0x1234")));
  assert(FailingField(record) == fields::kTargetSignature);
}

void TestSignedAnnouncementChecksSignature() {
  const auto good = Signed(CreateBroadcast("42", "https://example.org/post", kContentHash));
  assert(IsSignedAnnouncement(ToRecord(good)));
  assert(ValidateSignedAnnouncement(ToRecord(good)) == good);

  auto record                  = ToRecord(good);
  record[fields::kSignature]   = std::string("0xdead");
  assert(!IsSignedAnnouncement(record));

  record.erase(fields::kSignature);
  assert(!IsSignedAnnouncement(record));
  assert(IsAnnouncement(record));
}

void TestJsonInput() {
  assert(IsAnnouncement(RecordFromJson(R"({"dsnpType":2,"fromId":"42","url":"https://example.org/post","contentHash":")" + kContentHash +
                                       R"("})")));

  bool threw = false;
  try {
    RecordFromJson("[1, 2, 3]");
  } catch (const ValidationError& e) {
    threw = true;
    assert(e.field() == "announcement");
  }
  assert(threw);

  // Booleans are not integers.
  assert(!IsAnnouncement(RecordFromJson(R"({"dsnpType":true,"fromId":"42"})")));
}

void TestIdentifierFormats() {
  assert(IsDsnpUserId("0"));
  assert(IsDsnpUserId("18446744073709551615"));
  assert(!IsDsnpUserId("18446744073709551616"));
  assert(IsDsnpUserId("0x2a"));
  assert(!IsDsnpUserId("0x"));
  assert(!IsDsnpUserId("0x12345678901234567"));
  assert(!IsDsnpUserId(""));
  assert(!IsDsnpUserId("-1"));

  assert(IsDsnpAnnouncementId(AnnouncementId("42")));
  assert(IsDsnpAnnouncementId(AnnouncementId("0x2a", 'F')));
  assert(!IsDsnpAnnouncementId("dsnp://42/" + std::string(64, 'c')));
  assert(!IsDsnpAnnouncementId("https://42/0x" + std::string(64, 'c')));

  assert(IsContentHash(kContentHash));
  assert(IsContentHash("0x" + kContentHash));
  assert(!IsContentHash(kContentHash.substr(1)));

  assert(IsSignature(kSignature));
  assert(!IsSignature(kSignature.substr(2)));
}

void TestEmojiRanges() {
  assert(IsEmoji("\xF0\x9F\x91\x8D"));                                  // U+1F44D
  assert(IsEmoji("\xE2\x9D\xA4\xEF\xB8\x8F"));                          // U+2764 U+FE0F
  assert(IsEmoji("\xF0\x9F\x91\xA9\xE2\x80\x8D\xF0\x9F\x9A\x80"));      // ZWJ sequence
  assert(!IsEmoji(""));
  assert(!IsEmoji("a"));
  assert(!IsEmoji("\xF0\x9F\x91\x8D" "a"));
  assert(!IsEmoji("\xF0\x9F\x91"));                                     // truncated
  assert(!IsEmoji("\xC0\x80"));                                         // overlong
}

} // namespace

int main() {
  TestEveryFactoryProducesAValidAnnouncement();
  TestTypedValidatorsReturnTheTypedValue();
  TestMissingAndMistypedFields();
  TestWrongDiscriminantForTypedValidator();
  TestUnknownTypeValue();
  TestGraphChangeRules();
  TestReactionRejectsNonEmoji();
  TestTombstoneTargetRules();
  TestSignedAnnouncementChecksSignature();
  TestJsonInput();
  TestIdentifierFormats();
  TestEmojiRanges();

  std::cout << "dsnp_unit_announcement_validation: pass\n";
  return 0;
}
