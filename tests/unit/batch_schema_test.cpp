#include "internal/batch/batch_schema.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/announcement/record.hpp"
#include "internal/util/errors.hpp"

namespace {

using dsnp::announcement::AnnouncementType;
using namespace dsnp::batch;
namespace fields = dsnp::announcement::fields;

std::vector<std::string> ColumnNames(const BatchSchema& schema) {
  std::vector<std::string> names;
  for (const auto& column : schema) names.push_back(column.name);
  return names;
}

bool ThrowsUnsupported(std::int32_t type) {
  try {
    SchemaFor(type);
  } catch (const dsnp::util::UnsupportedAnnouncementTypeError& e) {
    assert(e.value() == type);
    return true;
  }
  return false;
}

void TestEveryBatchableTypeHasAFixedLayout() {
  for (auto type : {AnnouncementType::kGraphChange, AnnouncementType::kBroadcast, AnnouncementType::kReply, AnnouncementType::kReaction,
                    AnnouncementType::kProfile}) {
    const auto& schema = SchemaFor(type);
    assert(!schema.empty());
    assert(schema.front() == (ColumnSpec{fields::kDsnpType, StorageType::kInt32}));
    assert(schema.back() == (ColumnSpec{fields::kSignature, StorageType::kByteArray}));

    // Same table every time.
    assert(&SchemaFor(type) == &schema);
    assert(&SchemaFor(static_cast<std::int32_t>(type)) == &schema);

    // Bloom columns are schema columns.
    for (const auto& column : BloomFilterSpecFor(type)) {
      const auto names = ColumnNames(schema);
      assert(std::find(names.begin(), names.end(), column) != names.end());
    }
  }
}

void TestGraphChangeColumns() {
  const auto& schema = SchemaFor(AnnouncementType::kGraphChange);
  assert((ColumnNames(schema) ==
          std::vector<std::string>{fields::kDsnpType, fields::kFromId, fields::kChangeType, fields::kObjectId, fields::kCreatedAt,
                                   fields::kSignature}));
  assert(schema[2].type == StorageType::kInt32);
  assert(schema[4].type == StorageType::kInt64);
}

void TestReplyAndReactionColumns() {
  assert((ColumnNames(SchemaFor(AnnouncementType::kReply)) ==
          std::vector<std::string>{fields::kDsnpType, fields::kFromId, fields::kUrl, fields::kContentHash, fields::kInReplyTo,
                                   fields::kSignature}));
  assert((ColumnNames(SchemaFor(AnnouncementType::kReaction)) ==
          std::vector<std::string>{fields::kDsnpType, fields::kFromId, fields::kEmoji, fields::kInReplyTo, fields::kSignature}));
}

void TestBloomFilterSpecs() {
  const BloomFilterSpec author_only{fields::kFromId};
  assert(BloomFilterSpecFor(AnnouncementType::kGraphChange) == author_only);
  assert(BloomFilterSpecFor(AnnouncementType::kBroadcast) == author_only);
  assert(BloomFilterSpecFor(AnnouncementType::kProfile) == author_only);
  assert((BloomFilterSpecFor(AnnouncementType::kReply) == BloomFilterSpec{fields::kFromId, fields::kInReplyTo}));
  assert((BloomFilterSpecFor(AnnouncementType::kReaction) == BloomFilterSpec{fields::kEmoji, fields::kFromId, fields::kInReplyTo}));
}

void TestTombstoneAndUnknownValuesAreUnsupported() {
  assert(ThrowsUnsupported(0));
  assert(ThrowsUnsupported(99));
  assert(ThrowsUnsupported(-1));

  bool threw = false;
  try {
    BloomFilterSpecFor(AnnouncementType::kTombstone);
  } catch (const dsnp::util::UnsupportedAnnouncementTypeError&) {
    threw = true;
  }
  assert(threw);
}

void TestParquetSchemaMirrorsTheTable() {
  const auto& schema = SchemaFor(AnnouncementType::kGraphChange);
  auto        node   = BuildParquetSchema(schema);
  assert(node->field_count() == static_cast<int>(schema.size()));

  for (std::size_t i = 0; i < schema.size(); ++i) {
    const auto& field = node->field(static_cast<int>(i));
    assert(field->name() == schema[i].name);
    assert(field->is_required());
  }
  assert(StorageTypeName(schema[4].type) == "INT64");
}

} // namespace

int main() {
  TestEveryBatchableTypeHasAFixedLayout();
  TestGraphChangeColumns();
  TestReplyAndReactionColumns();
  TestBloomFilterSpecs();
  TestTombstoneAndUnknownValuesAreUnsupported();
  TestParquetSchemaMirrorsTheTable();

  std::cout << "dsnp_unit_batch_schema: pass\n";
  return 0;
}
