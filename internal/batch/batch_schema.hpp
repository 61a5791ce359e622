#pragma once

#include <parquet/schema.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/announcement/announcement.hpp"

namespace dsnp::batch {

/*
  Schema selection for batch files.

  Every batchable announcement type maps to one fixed column layout and one
  set of bloom-filtered columns. The tables are immutable statics shared by
  every writer and reader.

  Tombstones are never batched; asking for their schema (or for any value
  outside the enum) throws util::UnsupportedAnnouncementTypeError.
*/

enum class StorageType {
  kInt32,
  kInt64,
  kByteArray,
};

struct ColumnSpec {
  std::string name;
  StorageType type;
};

bool operator==(const ColumnSpec& lhs, const ColumnSpec& rhs);

using BatchSchema     = std::vector<ColumnSpec>;
using BloomFilterSpec = std::vector<std::string>;

const BatchSchema& SchemaFor(announcement::AnnouncementType type);
const BatchSchema& SchemaFor(std::int32_t type);

const BloomFilterSpec& BloomFilterSpecFor(announcement::AnnouncementType type);
const BloomFilterSpec& BloomFilterSpecFor(std::int32_t type);

std::string StorageTypeName(StorageType type);

/*
  Parquet group node for `schema`.

  All columns are REQUIRED; BYTE_ARRAY columns carry the String logical
  type, integers the signed Int logical type.
*/
std::shared_ptr<parquet::schema::GroupNode> BuildParquetSchema(const BatchSchema& schema);

} // namespace dsnp::batch
