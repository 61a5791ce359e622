#pragma once

#include <arrow/io/interfaces.h>
#include <parquet/file_reader.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "internal/announcement/announcement.hpp"
#include "internal/batch/batch_schema.hpp"
#include "internal/storage/content_store.hpp"

namespace dsnp::batch {

/*
  Reader for batch files produced by BatchWriter.

      auto reader = BatchReader::Open("/data/batches/0001.parquet");
      if (reader->Probe("fromId", "42")) {
        reader->ForEachRow([](const SignedAnnouncement& row) { ... });
      }

  Open() checks the column layout against the schema for the stored
  announcement type and throws util::CorruptBatchError on mismatch. Rows are
  decoded without structural validation and come back in write order.

  Probe() reads the Parquet bloom filter block of each row group for the
  column: false means the value is definitely absent; true means it may be
  present. Columns without a filter always answer false.
*/
class BatchReader {
 public:
  using RowVisitor = std::function<void(const announcement::SignedAnnouncement&)>;

  // Local path or filesystem URI (file://, s3:// ...).
  static std::unique_ptr<BatchReader> Open(const std::string& location);
  static std::unique_ptr<BatchReader> Open(std::shared_ptr<arrow::io::RandomAccessFile> file);
  static std::unique_ptr<BatchReader> OpenStored(storage::ContentStore& store, const std::string& key);

  ~BatchReader();

  BatchReader(const BatchReader&)            = delete;
  BatchReader& operator=(const BatchReader&) = delete;

  void ForEachRow(const RowVisitor& visit);

  bool Probe(const std::string& column, const std::string& value) const;
  bool Probe(const std::string& column, std::int64_t value) const;

  // Releases the file. Safe to call more than once. Closing from inside a
  // ForEachRow visitor ends the iteration with std::logic_error.
  void Close();

  announcement::AnnouncementType announcement_type() const {
    return type_;
  }

  std::int64_t num_rows() const {
    return num_rows_;
  }

  int num_row_groups() const {
    return num_row_groups_;
  }

  const BatchSchema& schema() const {
    return *schema_;
  }

 private:
  explicit BatchReader(std::unique_ptr<parquet::ParquetFileReader> reader);

  void RequireOpen() const;
  void ReadRows(const RowVisitor& visit);
  void FinishIteration();

  template <typename Value>
  bool ProbeFilters(const std::string& column, const Value& value) const;

  std::unique_ptr<parquet::ParquetFileReader> reader_;
  announcement::AnnouncementType              type_{};
  const BatchSchema*                          schema_{nullptr};
  std::int64_t                                num_rows_{0};
  int                                         num_row_groups_{0};

  // Close() from a visitor parks the file here until the row loop unwinds.
  bool                                        iterating_{false};
  std::unique_ptr<parquet::ParquetFileReader> retired_;
};

} // namespace dsnp::batch
