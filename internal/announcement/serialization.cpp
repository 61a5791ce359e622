#include "internal/announcement/serialization.hpp"

namespace dsnp::announcement {

std::string Serialize(const Record& record) {
  std::string serialization;
  for (const auto& [key, value] : record) {
    serialization += key;
    serialization += FieldValueToString(value);
  }
  return serialization;
}

std::string Serialize(const Announcement& announcement) {
  return Serialize(ToRecord(announcement));
}

std::string Serialize(const SignedAnnouncement& announcement) {
  return Serialize(announcement.announcement);
}

} // namespace dsnp::announcement
