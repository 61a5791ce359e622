#include "internal/batch/batch_reader.hpp"

#include <arrow/filesystem/filesystem.h>
#include <arrow/io/memory.h>
#include <parquet/bloom_filter.h>
#include <parquet/bloom_filter_reader.h>
#include <parquet/column_reader.h>
#include <parquet/exception.h>
#include <parquet/metadata.h>
#include <parquet/types.h>

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <utility>
#include <variant>

#include "internal/announcement/record.hpp"
#include "internal/batch/batch_writer.hpp"
#include "internal/batch/bloom_filter_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace dsnp::batch {

using announcement::AnnouncementType;
using announcement::FieldValue;
using announcement::Record;
using announcement::SignedAnnouncement;
using storage::common::Unwrap;
namespace fields = announcement::fields;

namespace {

constexpr std::int64_t kReadChunkRows = 1024;

parquet::Type::type PhysicalType(StorageType type) {
  switch (type) {
    case StorageType::kInt32:
      return parquet::Type::INT32;
    case StorageType::kInt64:
      return parquet::Type::INT64;
    case StorageType::kByteArray:
      break;
  }
  return parquet::Type::BYTE_ARRAY;
}

std::int32_t ParseTypeValue(const std::string& text) {
  std::int32_t value = 0;
  auto [ptr, ec]     = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    throw util::CorruptBatchError("unreadable announcement type '" + text + "'");
  }
  return value;
}

// Reads `rows` values of a required column, copying them out of the reader's buffers.
template <typename Reader, typename Convert>
void ReadValues(parquet::ColumnReader* column, std::int64_t rows, std::vector<FieldValue>* out, Convert convert) {
  using Value = typename Reader::T;
  auto* reader = static_cast<Reader*>(column);

  std::vector<Value> buffer(static_cast<std::size_t>(rows));
  std::int64_t       total = 0;
  while (total < rows) {
    std::int64_t values_read = 0;
    reader->ReadBatch(rows - total, nullptr, nullptr, buffer.data() + total, &values_read);
    if (values_read == 0) {
      throw util::CorruptBatchError("column ended before its row group");
    }
    // ByteArray values point into the reader's page buffer; copy them now.
    for (std::int64_t i = total; i < total + values_read; ++i) {
      out->push_back(convert(buffer[static_cast<std::size_t>(i)]));
    }
    total += values_read;
  }
}

void ReadColumnChunk(parquet::ColumnReader* column, StorageType type, std::int64_t rows, std::vector<FieldValue>* out) {
  out->clear();
  out->reserve(static_cast<std::size_t>(rows));

  switch (type) {
    case StorageType::kInt32:
      ReadValues<parquet::Int32Reader>(column, rows, out, [](int32_t v) { return FieldValue(static_cast<std::int64_t>(v)); });
      break;
    case StorageType::kInt64:
      ReadValues<parquet::Int64Reader>(column, rows, out, [](int64_t v) { return FieldValue(static_cast<std::int64_t>(v)); });
      break;
    case StorageType::kByteArray:
      ReadValues<parquet::ByteArrayReader>(column, rows, out, [](const parquet::ByteArray& v) {
        return FieldValue(std::string(reinterpret_cast<const char*>(v.ptr), v.len));
      });
      break;
  }
}

const std::string& RowString(const Record& record, const char* name) {
  return std::get<std::string>(record.at(name));
}

std::int64_t RowInt(const Record& record, const char* name) {
  return std::get<std::int64_t>(record.at(name));
}

SignedAnnouncement DecodeRow(AnnouncementType type, const Record& record) {
  SignedAnnouncement row;
  row.signature = RowString(record, fields::kSignature);

  switch (type) {
    case AnnouncementType::kGraphChange:
      row.announcement = announcement::CreateGraphChange(RowString(record, fields::kFromId),
                                                         static_cast<announcement::GraphChangeType>(RowInt(record, fields::kChangeType)),
                                                         RowString(record, fields::kObjectId), RowInt(record, fields::kCreatedAt));
      break;
    case AnnouncementType::kBroadcast:
      row.announcement = announcement::CreateBroadcast(RowString(record, fields::kFromId), RowString(record, fields::kUrl),
                                                       RowString(record, fields::kContentHash));
      break;
    case AnnouncementType::kReply:
      row.announcement = announcement::CreateReply(RowString(record, fields::kFromId), RowString(record, fields::kUrl),
                                                   RowString(record, fields::kContentHash), RowString(record, fields::kInReplyTo));
      break;
    case AnnouncementType::kReaction:
      row.announcement = announcement::CreateReaction(RowString(record, fields::kFromId), RowString(record, fields::kEmoji),
                                                      RowString(record, fields::kInReplyTo));
      break;
    case AnnouncementType::kProfile:
      row.announcement = announcement::CreateProfile(RowString(record, fields::kFromId), RowString(record, fields::kUrl),
                                                     RowString(record, fields::kContentHash));
      break;
    case AnnouncementType::kTombstone:
      throw util::UnsupportedAnnouncementTypeError(static_cast<std::int32_t>(type));
  }
  return row;
}

} // namespace

// ------------------------------------------------------------------
// Open
// ------------------------------------------------------------------

std::unique_ptr<BatchReader> BatchReader::Open(const std::string& location) {
  std::string path;
  auto        fs   = Unwrap(arrow::fs::FileSystemFromUriOrPath(location, &path));
  auto        file = Unwrap(fs->OpenInputFile(path));
  return Open(std::move(file));
}

std::unique_ptr<BatchReader> BatchReader::Open(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  std::unique_ptr<parquet::ParquetFileReader> reader;
  try {
    reader = parquet::ParquetFileReader::Open(std::move(file));
  } catch (const parquet::ParquetException& e) {
    throw util::CorruptBatchError(e.what());
  }
  return std::unique_ptr<BatchReader>(new BatchReader(std::move(reader)));
}

std::unique_ptr<BatchReader> BatchReader::OpenStored(storage::ContentStore& store, const std::string& key) {
  return Open(std::make_shared<arrow::io::BufferReader>(store.Get(key)));
}

BatchReader::BatchReader(std::unique_ptr<parquet::ParquetFileReader> reader) : reader_(std::move(reader)) {
  auto metadata   = reader_->metadata();
  num_rows_       = metadata->num_rows();
  num_row_groups_ = metadata->num_row_groups();

  auto key_values = metadata->key_value_metadata();
  const int index = key_values ? key_values->FindKey(kAnnouncementTypeMetadataKey) : -1;

  std::int32_t type_value = 0;
  if (index >= 0) {
    type_value = ParseTypeValue(key_values->value(index));
  } else {
    // Written by another tool: fall back to the first row's discriminant.
    const auto* descr = metadata->schema();
    if (num_rows_ == 0 || descr->num_columns() == 0 || descr->Column(0)->name() != fields::kDsnpType ||
        descr->Column(0)->physical_type() != parquet::Type::INT32) {
      throw util::CorruptBatchError("announcement type is not recorded");
    }
    std::vector<FieldValue> first;
    ReadColumnChunk(reader_->RowGroup(0)->Column(0).get(), StorageType::kInt32, 1, &first);
    type_value = static_cast<std::int32_t>(std::get<std::int64_t>(first.front()));
  }

  try {
    schema_ = &SchemaFor(type_value);
  } catch (const util::UnsupportedAnnouncementTypeError& e) {
    throw util::CorruptBatchError(e.what());
  }
  type_ = static_cast<AnnouncementType>(type_value);

  const auto* descr = metadata->schema();
  if (descr->num_columns() != static_cast<int>(schema_->size())) {
    throw util::CorruptBatchError("expected " + std::to_string(schema_->size()) + " columns for " +
                                  announcement::AnnouncementTypeName(type_) + ", found " + std::to_string(descr->num_columns()));
  }
  for (std::size_t i = 0; i < schema_->size(); ++i) {
    const auto& expected = (*schema_)[i];
    const auto* actual   = descr->Column(static_cast<int>(i));
    if (actual->name() != expected.name || actual->physical_type() != PhysicalType(expected.type)) {
      throw util::CorruptBatchError("column " + std::to_string(i) + " is '" + actual->name() + "', expected '" + expected.name +
                                    "' of type " + StorageTypeName(expected.type));
    }
  }
}

BatchReader::~BatchReader() {
  try {
    Close();
  } catch (const std::exception& e) {
    DSNP_LOG_WARN("failed to close batch reader", {observability::StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// Rows
// ------------------------------------------------------------------

void BatchReader::RequireOpen() const {
  if (!reader_) {
    throw std::logic_error("batch reader is closed");
  }
}

void BatchReader::ForEachRow(const RowVisitor& visit) {
  RequireOpen();

  iterating_ = true;
  try {
    ReadRows(visit);
  } catch (const std::exception&) {
    FinishIteration();
    throw;
  }
  FinishIteration();
}

void BatchReader::FinishIteration() {
  iterating_ = false;
  if (retired_) {
    auto reader = std::move(retired_);
    reader->Close();
  }
}

void BatchReader::ReadRows(const RowVisitor& visit) {
  const auto&                          schema = *schema_;
  std::vector<std::vector<FieldValue>> chunk(schema.size());

  for (int group = 0; group < num_row_groups_; ++group) {
    RequireOpen();
    auto row_group = reader_->RowGroup(group);

    std::vector<std::shared_ptr<parquet::ColumnReader>> columns;
    columns.reserve(schema.size());
    for (std::size_t i = 0; i < schema.size(); ++i) {
      columns.push_back(row_group->Column(static_cast<int>(i)));
    }

    std::int64_t remaining = row_group->metadata()->num_rows();
    while (remaining > 0) {
      RequireOpen();
      const auto rows = std::min(kReadChunkRows, remaining);
      for (std::size_t i = 0; i < schema.size(); ++i) {
        ReadColumnChunk(columns[i].get(), schema[i].type, rows, &chunk[i]);
      }

      for (std::int64_t r = 0; r < rows; ++r) {
        RequireOpen();
        Record record;
        for (std::size_t i = 0; i < schema.size(); ++i) {
          record.emplace(schema[i].name, std::move(chunk[i][static_cast<std::size_t>(r)]));
        }
        visit(DecodeRow(type_, record));
      }
      remaining -= rows;
    }
  }
}

// ------------------------------------------------------------------
// Probe
// ------------------------------------------------------------------

// ORs the column's bloom filter block over every row group that has one.
template <typename Value>
bool BatchReader::ProbeFilters(const std::string& column, const Value& value) const {
  RequireOpen();

  auto it = std::find_if(schema_->begin(), schema_->end(), [&column](const ColumnSpec& c) { return c.name == column; });
  if (it == schema_->end()) return false;
  const auto column_index = static_cast<int>(it - schema_->begin());

  auto& filters = reader_->GetBloomFilterReader();
  for (int group = 0; group < num_row_groups_; ++group) {
    std::unique_ptr<parquet::BloomFilter> filter;
    try {
      filter = filters.RowGroup(group)->GetColumnBloomFilter(column_index);
    } catch (const parquet::ParquetException& e) {
      throw util::CorruptBatchError("bloom filter for '" + column + "' in row group " + std::to_string(group) + ": " + e.what());
    }
    if (filter && filter->FindHash(HashValue(*filter, it->type, value))) return true;
  }
  return false;
}

bool BatchReader::Probe(const std::string& column, const std::string& value) const {
  return ProbeFilters(column, value);
}

bool BatchReader::Probe(const std::string& column, std::int64_t value) const {
  return ProbeFilters(column, value);
}

void BatchReader::Close() {
  if (!reader_) return;

  if (iterating_) {
    retired_ = std::move(reader_);
    return;
  }
  auto reader = std::move(reader_);
  reader->Close();
}

} // namespace dsnp::batch
