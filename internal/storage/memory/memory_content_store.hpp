#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <arrow/buffer.h>

#include "internal/storage/content_store.hpp"

namespace dsnp::storage {

/*
  In-memory content store.

  Backed by Arrow buffers held in-process. Used by tests and by embedders
  that publish the bytes themselves.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class MemoryContentStore final : public ContentStore {
 public:
  explicit MemoryContentStore(std::string base_uri = "memory://");
  ~MemoryContentStore() override = default;

  // ContentStore interface
  using ContentStore::Put;
  std::string Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& content) override;

  std::string PutStream(const std::string& key, const WriteCallback& write) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;

  bool Exists(const std::string& key) override;

  void Remove(const std::string& key) override;

  std::size_t Size() const;

 private:
  std::string Uri(const std::string& key) const;

  std::string base_uri_;

  mutable std::shared_mutex                                        mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace dsnp::storage
