#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace gigbook::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageUnavailable
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw util::StorageUnavailable(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::StorageUnavailable(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

inline std::shared_ptr<arrow::Buffer> FromBytes(std::string bytes) {
  return arrow::Buffer::FromString(std::move(bytes));
}

} // namespace gigbook::storage::common
