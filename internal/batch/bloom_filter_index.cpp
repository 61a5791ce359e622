#include "internal/batch/bloom_filter_index.hpp"

#include <parquet/types.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace dsnp::batch {

void EnableBloomFilters(parquet::WriterProperties::Builder* builder, const BatchSchema& schema, const BloomFilterSpec& spec,
                        std::uint32_t ndv, double fpp) {
  if (ndv == 0) ndv = kDefaultBloomFilterNdv;
  if (fpp <= 0.0 || fpp >= 1.0) fpp = kDefaultBloomFilterFpp;

  parquet::BloomFilterOptions options;
  options.ndv = static_cast<int32_t>(std::min<std::uint32_t>(ndv, std::numeric_limits<int32_t>::max()));
  options.fpp = fpp;

  for (const auto& column : spec) {
    auto it = std::find_if(schema.begin(), schema.end(), [&column](const ColumnSpec& c) { return c.name == column; });
    if (it == schema.end()) {
      throw std::invalid_argument("bloom filter column not in schema: " + column);
    }
    builder->enable_bloom_filter(column, options);
  }
}

std::uint64_t HashValue(const parquet::BloomFilter& filter, StorageType type, const std::string& value) {
  if (type != StorageType::kByteArray) {
    throw std::invalid_argument("string probe on an integer column");
  }
  parquet::ByteArray bytes(static_cast<uint32_t>(value.size()), reinterpret_cast<const uint8_t*>(value.data()));
  return filter.Hash(&bytes);
}

std::uint64_t HashValue(const parquet::BloomFilter& filter, StorageType type, std::int64_t value) {
  switch (type) {
    case StorageType::kInt32:
      return filter.Hash(static_cast<int32_t>(value));
    case StorageType::kInt64:
      return filter.Hash(static_cast<int64_t>(value));
    case StorageType::kByteArray:
      break;
  }
  throw std::invalid_argument("integer probe on a byte array column");
}

} // namespace dsnp::batch
