#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>

namespace dsnp::storage::common {

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const std::string& path, dsnp::runtime::config::FileSystem filesystem) {
  std::string resolved_path = path;

  switch (filesystem) {
    case dsnp::runtime::config::FILE_SYSTEM_LOCAL:
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()),
                            resolved_path);
    case dsnp::runtime::config::FILE_SYSTEM_S3:
    case dsnp::runtime::config::FILE_SYSTEM_GCS:
    case dsnp::runtime::config::FILE_SYSTEM_HDFS:
    case dsnp::runtime::config::FILE_SYSTEM_AZURE: {
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
    case dsnp::runtime::config::FILE_SYSTEM_AUTO:
    default: {
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
  }
}

arrow::Compression::type ResolveCompression(dsnp::runtime::config::Compression compression) {
  switch (compression) {
    case dsnp::runtime::config::COMPRESSION_SNAPPY:
      return arrow::Compression::SNAPPY;
    case dsnp::runtime::config::COMPRESSION_GZIP:
      return arrow::Compression::GZIP;
    case dsnp::runtime::config::COMPRESSION_BROTLI:
      return arrow::Compression::BROTLI;
    case dsnp::runtime::config::COMPRESSION_ZSTD:
      return arrow::Compression::ZSTD;
    case dsnp::runtime::config::COMPRESSION_LZ4:
      return arrow::Compression::LZ4;
    case dsnp::runtime::config::COMPRESSION_UNCOMPRESSED:
    default:
      return arrow::Compression::UNCOMPRESSED;
  }
}

} // namespace dsnp::storage::common
