#include "object_content_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace dsnp::storage {

using namespace dsnp::storage::common;

ObjectContentStore::ObjectContentStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::string base_uri)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), base_uri_(std::move(base_uri)) {
}

/*
  Object key layout:

      <root_path>/<key>
*/
std::string ObjectContentStore::ObjectPath(const std::string& key) const {
  ValidateKey(key);
  return JoinUri(root_path_, key);
}

// Local filesystems need parent directories; object stores have flat keys.
void ObjectContentStore::PrepareParent(const std::string& path) const {
  const auto slash = path.rfind('/');
  if (fs_->type_name() == "local" && slash != std::string::npos && slash != 0) {
    Unwrap(fs_->CreateDir(path.substr(0, slash), true));
  }
}

std::string ObjectContentStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& content) {
  const auto path = ObjectPath(key);
  PrepareParent(path);
  auto out = Unwrap(fs_->OpenOutputStream(path));
  Unwrap(out->Write(content->data(), content->size()));
  Unwrap(out->Close());
  return JoinUri(base_uri_, key);
}

std::string ObjectContentStore::PutStream(const std::string& key, const WriteCallback& write) {
  const auto path = ObjectPath(key);
  PrepareParent(path);

  try {
    auto out = Unwrap(fs_->OpenOutputStream(path));
    write(out);
    if (!out->closed()) {
      Unwrap(out->Close());
    }
  } catch (...) {
    auto info   = fs_->GetFileInfo(path);
    auto status = (info.ok() && info->type() == arrow::fs::FileType::File) ? fs_->DeleteFile(path) : info.status();
    if (!status.ok()) {
      DSNP_LOG_WARN("failed to delete partial object",
                    {observability::StringField("path", path), observability::StringField("error", status.ToString())});
    }
    throw;
  }

  return JoinUri(base_uri_, key);
}

/*
  Download full object
*/
std::shared_ptr<arrow::Buffer> ObjectContentStore::Get(const std::string& key) {
  if (!Exists(key)) {
    throw util::NotFound("no content stored under key " + key);
  }
  auto input = Unwrap(fs_->OpenInputFile(ObjectPath(key)));
  return ReadAll(input);
}

bool ObjectContentStore::Exists(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  return info.type() == arrow::fs::FileType::File;
}

void ObjectContentStore::Remove(const std::string& key) {
  Unwrap(fs_->DeleteFile(ObjectPath(key)));
}

} // namespace dsnp::storage
