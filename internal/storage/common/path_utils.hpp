#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dsnp::storage::common {

/*
  Keys are relative, '/'-separated paths. Empty segments and "." / ".."
  are rejected so a key can never escape the store root.
*/
inline void ValidateKey(const std::string& key) {
  if (key.empty()) {
    throw std::invalid_argument("content key must not be empty");
  }
  if (key.front() == '/') {
    throw std::invalid_argument("content key must be relative: " + key);
  }

  std::string_view remaining = key;
  while (true) {
    const auto slash   = remaining.find('/');
    const auto segment = remaining.substr(0, slash);
    if (segment.empty() || segment == "." || segment == "..") {
      throw std::invalid_argument("content key contains an invalid path segment: " + key);
    }
    for (char c : segment) {
      if (c == '\\' || c == '\0') {
        throw std::invalid_argument("content key contains invalid character: " + key);
      }
    }
    if (slash == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(slash + 1);
  }
}

inline std::filesystem::path KeyPath(const std::filesystem::path& root, const std::string& key) {
  ValidateKey(key);
  return root / key;
}

inline std::string JoinUri(const std::string& base, const std::string& key) {
  if (base.empty() || base.back() == '/') {
    return base + key;
  }
  return base + "/" + key;
}

} // namespace dsnp::storage::common
