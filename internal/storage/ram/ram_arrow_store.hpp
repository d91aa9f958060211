#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/storage_backend.hpp"

namespace gigbook::storage {

/*
  RAM blob storage.

  Backed by Arrow buffers held in-memory; contents die with the process.
  Reads are zero-copy.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamArrowStore final : public StorageBackend {
public:
  RamArrowStore() = default;
  ~RamArrowStore() override = default;

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  bool Contains(const std::string& key) override;

  void Write(const std::string& key,
             const std::shared_ptr<arrow::Buffer>& buffer,
             bool fsync) override;

  void Remove(const std::string& key) override;

  std::string_view Kind() const override {
    return "ram";
  }

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace gigbook::storage
