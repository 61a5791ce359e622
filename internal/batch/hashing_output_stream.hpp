#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <memory>

#include "internal/crypto/content_hasher.hpp"

namespace dsnp::batch {

/*
  OutputStream decorator that feeds every byte written through it to a
  ContentHasher before forwarding it, unchanged and in order, to the inner
  stream.

  The digest therefore covers exactly the bytes the inner sink received.
  A failed inner write is not hashed.
*/
class HashingOutputStream final : public arrow::io::OutputStream {
 public:
  HashingOutputStream(std::shared_ptr<arrow::io::OutputStream> inner, crypto::ContentHasher* hasher);
  ~HashingOutputStream() override;

  arrow::Status Write(const void* data, int64_t nbytes) override;
  arrow::Status Write(const std::shared_ptr<arrow::Buffer>& data) override;
  arrow::Status Flush() override;
  arrow::Status Close() override;
  arrow::Status Abort() override;

  arrow::Result<int64_t> Tell() const override;
  bool                   closed() const override;

 private:
  std::shared_ptr<arrow::io::OutputStream> inner_;
  crypto::ContentHasher*                   hasher_;
  int64_t                                  position_{0};
  bool                                     closed_{false};
};

} // namespace dsnp::batch
