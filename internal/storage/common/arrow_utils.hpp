#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace blobstream::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw StorageError
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw blobstream::util::StorageError(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw blobstream::util::StorageError(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

/*
  Allocate a writable buffer of `size` bytes from the default pool.
*/
inline std::shared_ptr<arrow::Buffer> AllocateMutable(int64_t size) {
  std::shared_ptr<arrow::Buffer> buffer = Unwrap(arrow::AllocateBuffer(size));
  return buffer;
}

/*
  Writable deep copy, for callers that must not touch the source bytes.
*/
inline std::shared_ptr<arrow::Buffer> MutableCopy(const arrow::Buffer& source) {
  auto copy = AllocateMutable(source.size());
  if (source.size() > 0) std::memcpy(copy->mutable_data(), source.data(), static_cast<size_t>(source.size()));
  return copy;
}

} // namespace blobstream::storage::common
