#pragma once

#include <filesystem>
#include <string>

#include <arrow/buffer.h>

#include "internal/storage/content_store.hpp"

namespace dsnp::storage {

/*
  Durable disk storage using Arrow IO.

  Properties:
    - atomic replace writes (tmp file + rename)
    - a failed PutStream leaves no file behind
    - optional flush before commit
*/

class DiskContentStore final : public ContentStore {
 public:
  DiskContentStore(std::filesystem::path root, std::string base_uri = {}, bool fsync = false);

  using ContentStore::Put;
  std::string Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& content) override;

  std::string PutStream(const std::string& key, const WriteCallback& write) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;

  bool Exists(const std::string& key) override;

  void Remove(const std::string& key) override;

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::string Uri(const std::string& key) const;

  std::filesystem::path root_;
  std::string           base_uri_;
  bool                  fsync_;
};

} // namespace dsnp::storage
