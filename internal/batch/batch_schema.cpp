#include "internal/batch/batch_schema.hpp"

#include <parquet/types.h>

#include "internal/announcement/record.hpp"
#include "internal/util/errors.hpp"

namespace dsnp::batch {

using announcement::AnnouncementType;
namespace fields = announcement::fields;

bool operator==(const ColumnSpec& lhs, const ColumnSpec& rhs) {
  return lhs.name == rhs.name && lhs.type == rhs.type;
}

const BatchSchema& SchemaFor(AnnouncementType type) {
  static const BatchSchema kGraphChange = {
      {fields::kDsnpType, StorageType::kInt32},     {fields::kFromId, StorageType::kByteArray},
      {fields::kChangeType, StorageType::kInt32},   {fields::kObjectId, StorageType::kByteArray},
      {fields::kCreatedAt, StorageType::kInt64},    {fields::kSignature, StorageType::kByteArray},
  };
  static const BatchSchema kBroadcast = {
      {fields::kDsnpType, StorageType::kInt32},        {fields::kFromId, StorageType::kByteArray},
      {fields::kUrl, StorageType::kByteArray},         {fields::kContentHash, StorageType::kByteArray},
      {fields::kSignature, StorageType::kByteArray},
  };
  static const BatchSchema kReply = {
      {fields::kDsnpType, StorageType::kInt32},        {fields::kFromId, StorageType::kByteArray},
      {fields::kUrl, StorageType::kByteArray},         {fields::kContentHash, StorageType::kByteArray},
      {fields::kInReplyTo, StorageType::kByteArray},   {fields::kSignature, StorageType::kByteArray},
  };
  static const BatchSchema kReaction = {
      {fields::kDsnpType, StorageType::kInt32},      {fields::kFromId, StorageType::kByteArray},
      {fields::kEmoji, StorageType::kByteArray},     {fields::kInReplyTo, StorageType::kByteArray},
      {fields::kSignature, StorageType::kByteArray},
  };
  static const BatchSchema kProfile = {
      {fields::kDsnpType, StorageType::kInt32},        {fields::kFromId, StorageType::kByteArray},
      {fields::kUrl, StorageType::kByteArray},         {fields::kContentHash, StorageType::kByteArray},
      {fields::kSignature, StorageType::kByteArray},
  };

  switch (type) {
    case AnnouncementType::kGraphChange:
      return kGraphChange;
    case AnnouncementType::kBroadcast:
      return kBroadcast;
    case AnnouncementType::kReply:
      return kReply;
    case AnnouncementType::kReaction:
      return kReaction;
    case AnnouncementType::kProfile:
      return kProfile;
    case AnnouncementType::kTombstone:
      break;
  }
  throw util::UnsupportedAnnouncementTypeError(static_cast<std::int32_t>(type));
}

const BatchSchema& SchemaFor(std::int32_t type) {
  return SchemaFor(static_cast<AnnouncementType>(type));
}

const BloomFilterSpec& BloomFilterSpecFor(AnnouncementType type) {
  static const BloomFilterSpec kAuthorOnly = {fields::kFromId};
  static const BloomFilterSpec kReply      = {fields::kFromId, fields::kInReplyTo};
  static const BloomFilterSpec kReaction   = {fields::kEmoji, fields::kFromId, fields::kInReplyTo};

  switch (type) {
    case AnnouncementType::kGraphChange:
    case AnnouncementType::kBroadcast:
    case AnnouncementType::kProfile:
      return kAuthorOnly;
    case AnnouncementType::kReply:
      return kReply;
    case AnnouncementType::kReaction:
      return kReaction;
    case AnnouncementType::kTombstone:
      break;
  }
  throw util::UnsupportedAnnouncementTypeError(static_cast<std::int32_t>(type));
}

const BloomFilterSpec& BloomFilterSpecFor(std::int32_t type) {
  return BloomFilterSpecFor(static_cast<AnnouncementType>(type));
}

std::string StorageTypeName(StorageType type) {
  switch (type) {
    case StorageType::kInt32:
      return "INT32";
    case StorageType::kInt64:
      return "INT64";
    case StorageType::kByteArray:
      return "BYTE_ARRAY";
  }
  return "UNKNOWN";
}

std::shared_ptr<parquet::schema::GroupNode> BuildParquetSchema(const BatchSchema& schema) {
  parquet::schema::NodeVector nodes;
  nodes.reserve(schema.size());

  for (const auto& column : schema) {
    switch (column.type) {
      case StorageType::kInt32:
        nodes.push_back(parquet::schema::PrimitiveNode::Make(column.name, parquet::Repetition::REQUIRED, parquet::LogicalType::Int(32, true),
                                                             parquet::Type::INT32));
        break;
      case StorageType::kInt64:
        nodes.push_back(parquet::schema::PrimitiveNode::Make(column.name, parquet::Repetition::REQUIRED, parquet::LogicalType::Int(64, true),
                                                             parquet::Type::INT64));
        break;
      case StorageType::kByteArray:
        nodes.push_back(parquet::schema::PrimitiveNode::Make(column.name, parquet::Repetition::REQUIRED, parquet::LogicalType::String(),
                                                             parquet::Type::BYTE_ARRAY));
        break;
    }
  }

  return std::static_pointer_cast<parquet::schema::GroupNode>(
      parquet::schema::GroupNode::Make("schema", parquet::Repetition::REQUIRED, nodes));
}

} // namespace dsnp::batch
