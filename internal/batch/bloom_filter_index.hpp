#pragma once

#include <parquet/bloom_filter.h>
#include <parquet/properties.h>

#include <cstdint>
#include <string>

#include "internal/batch/batch_schema.hpp"

namespace dsnp::batch {

inline constexpr std::uint32_t kDefaultBloomFilterNdv = 128 * 1024;
inline constexpr double        kDefaultBloomFilterFpp = 0.001;

/*
  Bloom filters are Parquet's own split-block filters: one block per
  (row group, indexed column), written by the Parquet file writer and
  referenced from the column chunk metadata. Any Parquet reader that
  understands bloom filter offsets can probe them.

  EnableBloomFilters() turns them on for every column of `spec`. A zero
  ndv or an fpp outside (0, 1) falls back to the defaults above.
*/
void EnableBloomFilters(parquet::WriterProperties::Builder* builder, const BatchSchema& schema, const BloomFilterSpec& spec,
                        std::uint32_t ndv, double fpp);

/*
  Hash of a column value as Parquet's bloom filters expect it: the byte
  string for BYTE_ARRAY columns, the integer itself for INT32 / INT64.
*/
std::uint64_t HashValue(const parquet::BloomFilter& filter, StorageType type, const std::string& value);
std::uint64_t HashValue(const parquet::BloomFilter& filter, StorageType type, std::int64_t value);

} // namespace dsnp::batch
