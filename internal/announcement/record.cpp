#include "internal/announcement/record.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <limits>
#include <sstream>
#include <type_traits>

#include "internal/util/errors.hpp"

namespace dsnp::announcement {

namespace {

std::int64_t TypeValue(AnnouncementType type) {
  return static_cast<std::int64_t>(type);
}

struct RecordBuilder {
  Record operator()(const GraphChange& value) const {
    return {
        {fields::kDsnpType, TypeValue(GraphChange::kType)},
        {fields::kFromId, value.from_id},
        {fields::kChangeType, static_cast<std::int64_t>(value.change_type)},
        {fields::kObjectId, value.object_id},
        {fields::kCreatedAt, value.created_at},
    };
  }

  Record operator()(const Broadcast& value) const {
    return {
        {fields::kDsnpType, TypeValue(Broadcast::kType)},
        {fields::kFromId, value.from_id},
        {fields::kUrl, value.url},
        {fields::kContentHash, value.content_hash},
    };
  }

  Record operator()(const Reply& value) const {
    return {
        {fields::kDsnpType, TypeValue(Reply::kType)},
        {fields::kFromId, value.from_id},
        {fields::kUrl, value.url},
        {fields::kContentHash, value.content_hash},
        {fields::kInReplyTo, value.in_reply_to},
    };
  }

  Record operator()(const Reaction& value) const {
    return {
        {fields::kDsnpType, TypeValue(Reaction::kType)},
        {fields::kFromId, value.from_id},
        {fields::kEmoji, value.emoji},
        {fields::kInReplyTo, value.in_reply_to},
    };
  }

  Record operator()(const Profile& value) const {
    return {
        {fields::kDsnpType, TypeValue(Profile::kType)},
        {fields::kFromId, value.from_id},
        {fields::kUrl, value.url},
        {fields::kContentHash, value.content_hash},
    };
  }

  Record operator()(const Tombstone& value) const {
    return {
        {fields::kDsnpType, TypeValue(Tombstone::kType)},
        {fields::kFromId, value.from_id},
        {fields::kCreatedAt, value.created_at},
        {fields::kTargetAnnouncementType, TypeValue(value.target_announcement_type)},
        {fields::kTargetSignature, value.target_signature},
    };
  }
};

FieldValue FromProtoValue(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      // JSON numbers arrive as doubles; integral values within the exactly
      // representable range are kept as integers.
      constexpr double kMaxExact = 9007199254740992.0;  // 2^53
      if (std::trunc(number) == number && std::fabs(number) <= kMaxExact) {
        return static_cast<std::int64_t>(number);
      }
      return number;
    }
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    default:
      return std::monostate{};
  }
}

} // namespace

Record ToRecord(const Announcement& announcement) {
  return std::visit(RecordBuilder{}, announcement);
}

Record ToRecord(const SignedAnnouncement& announcement) {
  auto record                 = ToRecord(announcement.announcement);
  record[fields::kSignature] = announcement.signature;
  return record;
}

Record RecordFromJson(const std::string& json) {
  google::protobuf::Value document;
  auto                    status = google::protobuf::util::JsonStringToMessage(json, &document);
  if (!status.ok()) {
    throw util::ValidationError("announcement", "not valid JSON: " + std::string(status.message()));
  }
  if (document.kind_case() != google::protobuf::Value::kStructValue) {
    throw util::ValidationError("announcement", "not a structured record");
  }

  Record record;
  for (const auto& [key, value] : document.struct_value().fields()) {
    record.emplace(key, FromProtoValue(value));
  }
  return record;
}

std::string FieldValueToString(const FieldValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return {};
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
          std::ostringstream out;
          out.precision(std::numeric_limits<double>::max_digits10);
          out << v;
          return out.str();
        } else {
          return v;
        }
      },
      value);
}

} // namespace dsnp::announcement
