#include "internal/batch/hashing_output_stream.hpp"

#include <utility>

namespace dsnp::batch {

HashingOutputStream::HashingOutputStream(std::shared_ptr<arrow::io::OutputStream> inner, crypto::ContentHasher* hasher)
    : inner_(std::move(inner)), hasher_(hasher) {
}

// The inner stream is owned by the store, which closes or discards it.
HashingOutputStream::~HashingOutputStream() = default;

arrow::Status HashingOutputStream::Write(const void* data, int64_t nbytes) {
  if (closed_) {
    return arrow::Status::Invalid("write to closed hashing stream");
  }
  ARROW_RETURN_NOT_OK(inner_->Write(data, nbytes));
  hasher_->Update(data, static_cast<std::size_t>(nbytes));
  position_ += nbytes;
  return arrow::Status::OK();
}

arrow::Status HashingOutputStream::Write(const std::shared_ptr<arrow::Buffer>& data) {
  if (closed_) {
    return arrow::Status::Invalid("write to closed hashing stream");
  }
  ARROW_RETURN_NOT_OK(inner_->Write(data));
  hasher_->Update(data->data(), static_cast<std::size_t>(data->size()));
  position_ += data->size();
  return arrow::Status::OK();
}

arrow::Status HashingOutputStream::Flush() {
  return inner_->Flush();
}

arrow::Status HashingOutputStream::Close() {
  if (closed_) {
    return arrow::Status::OK();
  }
  closed_ = true;
  return inner_->Close();
}

arrow::Status HashingOutputStream::Abort() {
  if (closed_) {
    return arrow::Status::OK();
  }
  closed_ = true;
  return inner_->Abort();
}

arrow::Result<int64_t> HashingOutputStream::Tell() const {
  return position_;
}

bool HashingOutputStream::closed() const {
  return closed_;
}

} // namespace dsnp::batch
