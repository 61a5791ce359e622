#include "disk_content_store.hpp"

#include <arrow/io/file.h>

#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace dsnp::storage {

using namespace dsnp::storage::common;

namespace {

void DiscardTemporary(const std::filesystem::path& tmp_path) {
  std::error_code ec;
  std::filesystem::remove(tmp_path, ec);
  if (ec) {
    DSNP_LOG_WARN("failed to remove partial content file",
                  {observability::StringField("path", tmp_path.string()), observability::StringField("error", ec.message())});
  }
}

} // namespace

DiskContentStore::DiskContentStore(std::filesystem::path root, std::string base_uri, bool fsync)
    : root_(std::move(root)), base_uri_(std::move(base_uri)), fsync_(fsync) {

  std::filesystem::create_directories(root_);
  if (base_uri_.empty()) {
    base_uri_ = "file://" + std::filesystem::absolute(root_).string();
  }
}

std::string DiskContentStore::Uri(const std::string& key) const {
  return JoinUri(base_uri_, key);
}

std::string DiskContentStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& content) {
  return PutStream(key, [&content](const std::shared_ptr<arrow::io::OutputStream>& out) {
    Unwrap(out->Write(content->data(), content->size()));
  });
}

/*
  Atomic write:
      write tmp → flush → close → rename

  Any exception from the callback removes the tmp file and propagates.
*/
std::string DiskContentStore::PutStream(const std::string& key, const WriteCallback& write) {
  auto final_path = KeyPath(root_, key);
  auto tmp_path   = std::filesystem::path(final_path.string() + ".tmp");

  std::filesystem::create_directories(final_path.parent_path());

  try {
    std::shared_ptr<arrow::io::FileOutputStream> out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
    write(out);

    if (!out->closed()) {
      if (fsync_)
        Unwrap(out->Flush());

      Unwrap(out->Close());
    }
  } catch (...) {
    DiscardTemporary(tmp_path);
    throw;
  }

  std::filesystem::rename(tmp_path, final_path);
  return Uri(key);
}

/*
  Read entire object from disk.
*/
std::shared_ptr<arrow::Buffer> DiskContentStore::Get(const std::string& key) {
  auto path = KeyPath(root_, key);
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("no content stored under key " + key);
  }

  std::shared_ptr<arrow::io::RandomAccessFile> file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

bool DiskContentStore::Exists(const std::string& key) {
  return std::filesystem::exists(KeyPath(root_, key));
}

void DiskContentStore::Remove(const std::string& key) {
  std::filesystem::remove(KeyPath(root_, key));
}

} // namespace dsnp::storage
