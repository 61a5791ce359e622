#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/storage/content_store.hpp"

namespace dsnp::storage {

/*
  Builds the configured content store.

      auto store = StorageFactory::Build(config.storage());
      store->PutStream("batches/0001.parquet", ...)

  With no backend configured an in-memory store is returned.
*/

class StorageFactory {
 public:
  static ContentStorePtr Build(const dsnp::runtime::config::StorageConfig& cfg);
};

} // namespace dsnp::storage
