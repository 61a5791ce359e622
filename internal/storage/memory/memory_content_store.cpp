#include "memory_content_store.hpp"

#include <arrow/io/memory.h>

#include <mutex>
#include <utility>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace dsnp::storage {

using namespace dsnp::storage::common;

MemoryContentStore::MemoryContentStore(std::string base_uri) : base_uri_(std::move(base_uri)) {
}

std::string MemoryContentStore::Uri(const std::string& key) const {
  return JoinUri(base_uri_, key);
}

std::string MemoryContentStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& content) {
  ValidateKey(key);
  {
    std::unique_lock lock(mutex_);
    buffers_[key] = content;
  }
  return Uri(key);
}

/*
  Buffer the stream locally and publish it only once the callback has
  returned; a throwing callback leaves the store untouched.
*/
std::string MemoryContentStore::PutStream(const std::string& key, const WriteCallback& write) {
  ValidateKey(key);

  std::shared_ptr<arrow::io::BufferOutputStream> sink = Unwrap(arrow::io::BufferOutputStream::Create());
  write(sink);

  // Finish() closes the stream if the callback did not.
  std::shared_ptr<arrow::Buffer> content = Unwrap(sink->Finish());
  return Put(key, content);
}

std::shared_ptr<arrow::Buffer> MemoryContentStore::Get(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(key);
  if (it == buffers_.end()) throw util::NotFound("no content stored under key " + key);

  return it->second;
}

bool MemoryContentStore::Exists(const std::string& key) {
  std::shared_lock lock(mutex_);
  return buffers_.find(key) != buffers_.end();
}

void MemoryContentStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);
  buffers_.erase(key);
}

std::size_t MemoryContentStore::Size() const {
  std::shared_lock lock(mutex_);
  return buffers_.size();
}

} // namespace dsnp::storage
