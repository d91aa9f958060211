#include "disk_arrow_store.hpp"

#include <arrow/io/file.h>

#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace gigbook::storage {

using namespace gigbook::storage::common;

namespace {

void ThrowIfError(const std::error_code& ec, const std::string& what) {
  if (ec) throw util::StorageUnavailable(what + ": " + ec.message());
}

} // namespace

DiskArrowStore::DiskArrowStore(std::filesystem::path root)
    : root_(std::move(root)) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  ThrowIfError(ec, "create blob root " + root_.string());
}

std::shared_ptr<arrow::Buffer> DiskArrowStore::Read(const std::string& key) {
  auto path = BlobPath(root_, key);
  if (!std::filesystem::exists(path)) return nullptr;

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

bool DiskArrowStore::Contains(const std::string& key) {
  return std::filesystem::exists(BlobPath(root_, key));
}

uint64_t DiskArrowStore::Size(const std::string& key) {
  std::error_code ec;
  auto size = std::filesystem::file_size(BlobPath(root_, key), ec);
  return ec ? 0 : static_cast<uint64_t>(size);
}

/*
  Atomic write:
      write tmp → flush → rename
*/
void DiskArrowStore::Write(const std::string& key,
                           const std::shared_ptr<arrow::Buffer>& buffer,
                           bool fsync) {
  if (!buffer) throw std::invalid_argument("blob buffer must not be null");

  auto final_path = BlobPath(root_, key);
  auto tmp_path = final_path.string() + ".tmp";

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(buffer->data(), buffer->size()));

    if (fsync)
      Unwrap(out->Flush());

    Unwrap(out->Close());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, final_path, ec);
  ThrowIfError(ec, "rename " + tmp_path);
}

void DiskArrowStore::Remove(const std::string& key) {
  std::error_code ec;
  std::filesystem::remove(BlobPath(root_, key), ec);
  ThrowIfError(ec, "remove blob " + key);
}

} // namespace gigbook::storage
