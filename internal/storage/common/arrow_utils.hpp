#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/util/compression.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace dsnp::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return std::move(result).ValueOrDie();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->ReadAt(0, size));
}

/*
  Resolve a filesystem for `path`.

  Returns the filesystem and the path inside it. FILE_SYSTEM_AUTO accepts
  both URIs (s3://bucket/prefix) and plain local paths.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const std::string& path, dsnp::runtime::config::FileSystem filesystem);

arrow::Compression::type ResolveCompression(dsnp::runtime::config::Compression compression);

} // namespace dsnp::storage::common
