#include "internal/batch/batch_writer.hpp"

#include <arrow/util/key_value_metadata.h>
#include <parquet/column_writer.h>
#include <parquet/properties.h>
#include <parquet/types.h>

#include <utility>
#include <variant>

#include "internal/announcement/record.hpp"
#include "internal/announcement/validation.hpp"
#include "internal/batch/hashing_output_stream.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace dsnp::batch {

using announcement::AnnouncementType;
using announcement::SignedAnnouncement;
using storage::common::Unwrap;

namespace {

std::shared_ptr<parquet::WriterProperties> BuildWriterProperties(AnnouncementType type, const BatchSchema& schema,
                                                                 const BatchOptions& options) {
  parquet::WriterProperties::Builder builder;
  builder.compression(options.compression);
  builder.created_by("dsnp-sdk");
  EnableBloomFilters(&builder, schema, BloomFilterSpecFor(type), options.bloom_filter_ndv, options.bloom_filter_fpp);
  return builder.build();
}

const announcement::FieldValue& RequireColumn(const announcement::Record& record, const ColumnSpec& column) {
  auto it = record.find(column.name);
  if (it == record.end()) {
    throw util::ValidationError(column.name, "missing");
  }
  return it->second;
}

std::int64_t IntegerColumn(const announcement::Record& record, const ColumnSpec& column) {
  const auto& value = RequireColumn(record, column);
  if (const auto* integer = std::get_if<std::int64_t>(&value)) {
    return *integer;
  }
  throw util::ValidationError(column.name, "must be an integer");
}

const std::string& StringColumn(const announcement::Record& record, const ColumnSpec& column) {
  const auto& value = RequireColumn(record, column);
  if (const auto* text = std::get_if<std::string>(&value)) {
    return *text;
  }
  throw util::ValidationError(column.name, "must be a string");
}

} // namespace

// ------------------------------------------------------------------
// BatchWriter
// ------------------------------------------------------------------

BatchWriter::BatchWriter(std::shared_ptr<arrow::io::OutputStream> sink, AnnouncementType type, const BatchOptions& options)
    : type_(type),
      schema_(SchemaFor(type)),
      options_(options) {

  file_writer_ =
      parquet::ParquetFileWriter::Open(std::move(sink), BuildParquetSchema(schema_), BuildWriterProperties(type_, schema_, options_));
}

BatchWriter::~BatchWriter() = default;

// Appending a row group closes the previous one, which writes its pages to the sink.
void BatchWriter::StartRowGroup() {
  row_group_     = file_writer_->AppendBufferedRowGroup();
  rows_in_group_ = 0;
}

void BatchWriter::Append(const SignedAnnouncement& announcement) {
  if (closed_) {
    throw std::logic_error("batch writer is closed");
  }

  const auto actual = announcement::AnnouncementTypeOf(announcement);
  if (actual != type_) {
    throw util::MixedTypeBatchError(static_cast<std::int32_t>(type_), static_cast<std::int32_t>(actual), rows_written_);
  }
  if (options_.validate_rows) {
    announcement::Validate(announcement);
  }

  if (row_group_ == nullptr || (options_.max_rows_per_row_group != 0 && rows_in_group_ == options_.max_rows_per_row_group)) {
    StartRowGroup();
  }

  const auto record = announcement::ToRecord(announcement);

  for (std::size_t i = 0; i < schema_.size(); ++i) {
    const auto& column = schema_[i];
    auto*       writer = row_group_->column(static_cast<int>(i));

    switch (column.type) {
      case StorageType::kInt32: {
        const auto value = static_cast<int32_t>(IntegerColumn(record, column));
        static_cast<parquet::Int32Writer*>(writer)->WriteBatch(1, nullptr, nullptr, &value);
        break;
      }
      case StorageType::kInt64: {
        const auto value = static_cast<int64_t>(IntegerColumn(record, column));
        static_cast<parquet::Int64Writer*>(writer)->WriteBatch(1, nullptr, nullptr, &value);
        break;
      }
      case StorageType::kByteArray: {
        const auto&              text = StringColumn(record, column);
        const parquet::ByteArray value(static_cast<uint32_t>(text.size()), reinterpret_cast<const uint8_t*>(text.data()));
        static_cast<parquet::ByteArrayWriter*>(writer)->WriteBatch(1, nullptr, nullptr, &value);
        break;
      }
    }
  }

  ++rows_in_group_;
  ++rows_written_;
}

std::uint64_t BatchWriter::Close() {
  if (closed_) {
    return rows_written_;
  }

  file_writer_->AddKeyValueMetadata(
      arrow::key_value_metadata({kAnnouncementTypeMetadataKey}, {std::to_string(static_cast<std::int32_t>(type_))}));
  file_writer_->Close();
  closed_ = true;
  return rows_written_;
}

// ------------------------------------------------------------------
// WriteBatch / CreateBatch
// ------------------------------------------------------------------

namespace {

std::uint64_t WriteAll(const std::shared_ptr<arrow::io::OutputStream>& sink, AnnouncementType type, AnnouncementSource& source,
                       const BatchOptions& options) {
  BatchWriter writer(sink, type, options);
  while (auto next = source.Next()) {
    writer.Append(*next);
  }
  return writer.Close();
}

} // namespace

std::uint64_t WriteBatch(const std::shared_ptr<arrow::io::OutputStream>& sink, AnnouncementSource& source, const BatchOptions& options) {
  PeekingSource peeking(source);
  const auto*   first = peeking.Peek();
  if (first == nullptr) {
    throw util::EmptyBatchError();
  }
  return WriteAll(sink, announcement::AnnouncementTypeOf(*first), peeking, options);
}

BatchArtifact CreateBatch(const std::string& key, AnnouncementSource& source, storage::ContentStore& store, const BatchOptions& options) {
  PeekingSource peeking(source);
  const auto*   first = peeking.Peek();
  if (first == nullptr) {
    throw util::EmptyBatchError();
  }

  // Reject untyped batches before the store is touched.
  const auto type = announcement::AnnouncementTypeOf(*first);
  SchemaFor(type);

  crypto::ContentHasher hasher(options.content_digest);
  std::uint64_t         rows = 0;
  std::string           uri;

  try {
    uri = store.PutStream(key, [&](const std::shared_ptr<arrow::io::OutputStream>& sink) {
      auto hashing = std::make_shared<HashingOutputStream>(sink, &hasher);
      rows         = WriteAll(hashing, type, peeking, options);
      // The store closes the sink on commit, applying its own durability settings.
      Unwrap(hashing->Flush());
    });
  } catch (const std::exception& e) {
    DSNP_LOG_WARN("batch write failed; destination discarded",
                  {observability::StringField("key", key), observability::StringField("error", e.what())});
    throw;
  }

  BatchArtifact artifact;
  artifact.uri               = std::move(uri);
  artifact.content_hash      = hasher.HexDigest();
  artifact.row_count         = rows;
  artifact.announcement_type = type;

  DSNP_LOG_INFO("batch created",
                {observability::StringField("uri", artifact.uri),
                 observability::StringField("type", announcement::AnnouncementTypeName(type)),
                 observability::IntField("rows", static_cast<std::int64_t>(rows)),
                 observability::StringField("content_hash", artifact.content_hash)});
  return artifact;
}

} // namespace dsnp::batch
