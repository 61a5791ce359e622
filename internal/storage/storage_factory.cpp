#include "storage_factory.hpp"

#include <filesystem>

#include "common/arrow_utils.hpp"
#include "common/path_utils.hpp"
#include "disk/disk_content_store.hpp"
#include "memory/memory_content_store.hpp"
#include "object/object_content_store.hpp"

namespace dsnp::storage {

ContentStorePtr StorageFactory::Build(const dsnp::runtime::config::StorageConfig& cfg) {
  using dsnp::runtime::config::StorageConfig;

  switch (cfg.backend_case()) {
    case StorageConfig::kDisk: {
      std::filesystem::path disk_root =
          cfg.disk().root_path().empty() ? std::filesystem::path{"/tmp/dsnp-sdk"} : std::filesystem::path{cfg.disk().root_path()};
      return std::make_shared<DiskContentStore>(std::move(disk_root), cfg.disk().base_uri(), cfg.disk().fsync());
    }

    case StorageConfig::kObject: {
      const auto& object = cfg.object();
      auto [fs, root]    = common::Unwrap(common::ResolveFileSystem(object.root_path(), object.filesystem()));
      return std::make_shared<ObjectContentStore>(std::move(fs), std::move(root), object.root_path());
    }

    case StorageConfig::kMemory:
      if (!cfg.memory().base_uri().empty()) {
        return std::make_shared<MemoryContentStore>(cfg.memory().base_uri());
      }
      return std::make_shared<MemoryContentStore>();

    case StorageConfig::BACKEND_NOT_SET:
    default:
      return std::make_shared<MemoryContentStore>();
  }
}

} // namespace dsnp::storage
