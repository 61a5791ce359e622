#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace dsnp::storage {

/*
  Content store abstraction.

  Stores opaque blobs by key and hands back the URI under which the blob
  can later be retrieved. The SDK decides nothing about the backend; it
  only relies on these guarantees:

    - PutStream commits the object only if the callback returns normally.
      If the callback throws, nothing is retrievable under the key and the
      exception propagates unchanged.
    - Bytes reach the backend in exactly the order they were written.

  Implementations:
    MEMORY   → Arrow buffers held in-process (tests, embedding)
    DISK     → Arrow file IO, atomic rename on commit
    OBJECT   → Arrow filesystem (S3 / GCS / HDFS / Azure / local URI)
*/

class ContentStore {
 public:
  using WriteCallback = std::function<void(const std::shared_ptr<arrow::io::OutputStream>&)>;

  virtual ~ContentStore() = default;

  // ------------------------------------------------------------------
  // Put
  // ------------------------------------------------------------------
  virtual std::string Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& content) = 0;

  std::string Put(const std::string& key, std::string_view content) {
    return Put(key, arrow::Buffer::FromString(std::string(content)));
  }

  // ------------------------------------------------------------------
  // PutStream
  // ------------------------------------------------------------------
  /*
    Open a scoped sink for `key` and run `write` against it.

    The callback may close the sink itself; the store closes it otherwise.
    Durability settings (the disk store's fsync) apply only to a sink the
    store closes, so streaming writers leave it open.
    Returns the URI of the committed object.
  */
  virtual std::string PutStream(const std::string& key, const WriteCallback& write) = 0;

  // ------------------------------------------------------------------
  // Get
  // ------------------------------------------------------------------
  // Throws util::NotFound when nothing is stored under `key`.
  virtual std::shared_ptr<arrow::Buffer> Get(const std::string& key) = 0;

  virtual bool Exists(const std::string& key) = 0;

  virtual void Remove(const std::string& key) = 0;
};

using ContentStorePtr = std::shared_ptr<ContentStore>;

} // namespace dsnp::storage
