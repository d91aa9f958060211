#pragma once

#include <arrow/buffer.h>

#include <filesystem>

#include "internal/storage/storage_backend.hpp"

namespace gigbook::storage {

/*
  Durable blob storage using Arrow IO.

  Properties:
    - one file per key under root
    - atomic replace writes
    - optional fsync
*/

class DiskArrowStore final : public StorageBackend {
public:
  explicit DiskArrowStore(std::filesystem::path root);

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  bool Contains(const std::string& key) override;

  uint64_t Size(const std::string& key) override;

  void Write(const std::string& key,
             const std::shared_ptr<arrow::Buffer>& buffer,
             bool fsync) override;

  void Remove(const std::string& key) override;

  std::string_view Kind() const override {
    return "disk";
  }

  const std::filesystem::path& Root() const {
    return root_;
  }

private:
  std::filesystem::path root_;
};

} // namespace gigbook::storage
