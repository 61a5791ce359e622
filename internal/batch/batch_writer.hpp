#pragma once

#include <arrow/io/interfaces.h>
#include <arrow/util/compression.h>
#include <parquet/file_writer.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/announcement/announcement.hpp"
#include "internal/batch/announcement_source.hpp"
#include "internal/batch/batch_schema.hpp"
#include "internal/batch/bloom_filter_index.hpp"
#include "internal/crypto/content_hasher.hpp"
#include "internal/storage/content_store.hpp"

namespace dsnp::batch {

inline constexpr char kAnnouncementTypeMetadataKey[] = "dsnp.announcement_type";

inline constexpr std::uint64_t kDefaultRowsPerRowGroup = 4096;

struct BatchOptions {
  arrow::Compression::type compression = arrow::Compression::UNCOMPRESSED;

  // A full row group is flushed to the sink before the next row is
  // encoded. 0 keeps the whole batch in one row group held in memory.
  std::uint64_t max_rows_per_row_group = kDefaultRowsPerRowGroup;

  // Structural validation of every row before it is written.
  bool validate_rows = true;

  std::uint32_t bloom_filter_ndv = kDefaultBloomFilterNdv;
  double        bloom_filter_fpp = kDefaultBloomFilterFpp;

  std::string content_digest = crypto::kDefaultContentDigest;
};

struct BatchArtifact {
  std::string                    uri;
  std::string                    content_hash;
  std::uint64_t                  row_count = 0;
  announcement::AnnouncementType announcement_type{};
};

/*
  Streaming Parquet encoder for one announcement type.

  Rows are appended one at a time into a buffered row group. When the
  group reaches max_rows_per_row_group it is encoded out to the sink, so
  the sink sees bytes while the source is still producing. Close() writes
  the bloom filter blocks and the footer (which records the announcement
  type) and leaves the sink open for its owner to close.

  A row whose type differs from the batch type throws
  util::MixedTypeBatchError; the file is then unusable and the caller must
  discard the sink.
*/
class BatchWriter {
 public:
  BatchWriter(std::shared_ptr<arrow::io::OutputStream> sink, announcement::AnnouncementType type, const BatchOptions& options);
  ~BatchWriter();

  BatchWriter(const BatchWriter&)            = delete;
  BatchWriter& operator=(const BatchWriter&) = delete;

  void Append(const announcement::SignedAnnouncement& announcement);

  // Finalize the file; returns the number of rows written.
  std::uint64_t Close();

  std::uint64_t rows_written() const {
    return rows_written_;
  }

 private:
  void StartRowGroup();

  announcement::AnnouncementType type_;
  const BatchSchema&             schema_;
  BatchOptions                   options_;

  std::unique_ptr<parquet::ParquetFileWriter> file_writer_;
  parquet::RowGroupWriter*                    row_group_{nullptr};

  std::uint64_t rows_in_group_{0};
  std::uint64_t rows_written_{0};
  bool          closed_{false};
};

/*
  Encode every announcement of `source` into `sink`.

  The first element fixes the batch type. Throws util::EmptyBatchError for
  an empty source before anything is written, and
  util::UnsupportedAnnouncementTypeError when that type has no batch schema.
*/
std::uint64_t WriteBatch(const std::shared_ptr<arrow::io::OutputStream>& sink, AnnouncementSource& source, const BatchOptions& options);

/*
  Encode `source` as one Parquet artifact stored under `key`.

  Bytes are hashed as they stream to the store, so the returned content hash
  is exactly the digest of the stored object. On any failure the store
  discards the destination and the error propagates.
*/
BatchArtifact CreateBatch(const std::string& key, AnnouncementSource& source, storage::ContentStore& store,
                          const BatchOptions& options = {});

} // namespace dsnp::batch
