#include "ram_arrow_store.hpp"

#include "internal/storage/common/path_utils.hpp"

namespace gigbook::storage {

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamArrowStore::Read(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(key);
  if (it == buffers_.end()) return nullptr;

  return it->second;
}

bool RamArrowStore::Contains(const std::string& key) {
  std::shared_lock lock(mutex_);
  return buffers_.find(key) != buffers_.end();
}

void RamArrowStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool /*fsync unused*/) {
  common::ValidateBlobKey(key);
  if (!buffer) throw std::invalid_argument("blob buffer must not be null");

  std::unique_lock lock(mutex_);
  buffers_[key] = buffer;
}

void RamArrowStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);
  buffers_.erase(key);
}

} // namespace gigbook::storage
