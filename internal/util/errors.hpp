#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace dsnp::util {

/*
  Central error types.

  Every message names the invariant that was violated so callers can
  branch on the exception type instead of parsing text.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingCollaborator : public std::runtime_error {
 public:
  explicit MissingCollaborator(const std::string& name) : std::runtime_error("no " + name + " configured") {
  }
};

class UnsupportedDigest : public std::runtime_error {
 public:
  explicit UnsupportedDigest(const std::string& name) : std::runtime_error("digest not available: " + name) {
  }
};

// ------------------------------------------------------------------
// Announcement validation
// ------------------------------------------------------------------

class ValidationError : public std::runtime_error {
 public:
  ValidationError(std::string field, const std::string& reason)
      : std::runtime_error("invalid announcement field '" + field + "': " + reason), field_(std::move(field)) {
  }

  const std::string& field() const {
    return field_;
  }

 private:
  std::string field_;
};

class UnknownAnnouncementTypeError : public ValidationError {
 public:
  explicit UnknownAnnouncementTypeError(std::int64_t value)
      : ValidationError("dsnpType", "unknown announcement type " + std::to_string(value)), value_(value) {
  }

  std::int64_t value() const {
    return value_;
  }

 private:
  std::int64_t value_;
};

// ------------------------------------------------------------------
// Batch codec
// ------------------------------------------------------------------

class UnsupportedAnnouncementTypeError : public std::runtime_error {
 public:
  explicit UnsupportedAnnouncementTypeError(std::int32_t value)
      : std::runtime_error("unsupported announcement type for batching: " + std::to_string(value)), value_(value) {
  }

  std::int32_t value() const {
    return value_;
  }

 private:
  std::int32_t value_;
};

class EmptyBatchError : public std::runtime_error {
 public:
  EmptyBatchError() : std::runtime_error("batch must contain at least one announcement") {
  }
};

class MixedTypeBatchError : public std::runtime_error {
 public:
  MixedTypeBatchError(std::int32_t expected, std::int32_t actual, std::uint64_t row)
      : std::runtime_error("batch mixes announcement types: expected " + std::to_string(expected) + ", got " +
                           std::to_string(actual) + " at row " + std::to_string(row)),
        expected_(expected),
        actual_(actual),
        row_(row) {
  }

  std::int32_t expected() const {
    return expected_;
  }
  std::int32_t actual() const {
    return actual_;
  }
  std::uint64_t row() const {
    return row_;
  }

 private:
  std::int32_t  expected_;
  std::int32_t  actual_;
  std::uint64_t row_;
};

class CorruptBatchError : public std::runtime_error {
 public:
  explicit CorruptBatchError(const std::string& msg) : std::runtime_error("corrupt batch file: " + msg) {
  }
};

} // namespace dsnp::util
