#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>
#include <string_view>

namespace gigbook::storage {

/*
  Blob byte storage.

  Every blob is represented as an Arrow Buffer addressed by its blob key.
  Callers never manipulate raw pointers, only buffers.

  Implementations:
    RAM   → in-memory Arrow buffers
    DISK  → Arrow file IO, one file per key

  Engine failures throw util::StorageUnavailable. Malformed keys throw
  std::invalid_argument.
*/

class StorageBackend {
 public:
  virtual ~StorageBackend() = default;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  /*
    Read the whole blob. nullptr when the key is absent.
  */
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& key) = 0;

  virtual bool Contains(const std::string& key) = 0;

  // ------------------------------------------------------------------
  // Size
  // ------------------------------------------------------------------
  /*
    Size in bytes, 0 when absent. Falls back to Read(); disk overrides
    with a metadata lookup.
  */
  virtual uint64_t Size(const std::string& key) {
    auto buffer = Read(key);
    return buffer ? static_cast<uint64_t>(buffer->size()) : 0;
  }

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Store or replace the bytes under `key`.
  */
  virtual void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------
  // Idempotent.
  virtual void Remove(const std::string& key) = 0;

  virtual std::string_view Kind() const = 0;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;

} // namespace gigbook::storage
