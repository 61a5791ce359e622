#pragma once

#include <memory>
#include <string>

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include "internal/storage/content_store.hpp"

namespace dsnp::storage {

/*
  Object storage through Arrow's filesystem layer (S3, GCS, HDFS, Azure or
  a local path behind a URI).

  Object stores are atomic per PUT, but a streamed upload that fails half
  way may still leave an object behind; PutStream deletes it before
  rethrowing.
*/

class ObjectContentStore final : public ContentStore {
 public:
  ObjectContentStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::string base_uri);

  using ContentStore::Put;
  std::string Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& content) override;

  std::string PutStream(const std::string& key, const WriteCallback& write) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;

  bool Exists(const std::string& key) override;

  void Remove(const std::string& key) override;

 private:
  std::string ObjectPath(const std::string& key) const;
  void        PrepareParent(const std::string& path) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  std::string                            base_uri_;
};

} // namespace dsnp::storage
