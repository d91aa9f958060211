#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/blob/blob_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/disk/disk_arrow_store.hpp"
#include "internal/storage/ram/ram_arrow_store.hpp"

namespace {

using gigbook::blob::BlobStore;
using gigbook::db::memory::MemoryRepository;
using gigbook::storage::DiskArrowStore;
using gigbook::storage::RamArrowStore;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "gigbook_blob_store_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void TestStoreGetDeleteOnRam() {
  auto      repo  = std::make_shared<MemoryRepository>();
  auto      bytes = std::make_shared<RamArrowStore>();
  BlobStore blobs(repo, bytes);

  std::string payload("\x00\x01\xffvoice", 8);
  auto        key = blobs.StoreBlob("audio_1", payload, "audio/webm");
  assert(key == "audio_1");

  auto blob = blobs.GetBlob(key);
  assert(blob.has_value());
  assert(blob->data == payload);
  assert(blob->mime_type == "audio/webm");
  assert(blob->size_bytes == payload.size());
  assert(blob->created_at_ms > 0);
  assert(blobs.Contains(key));

  blobs.DeleteBlob(key);
  blobs.DeleteBlob(key);
  assert(!blobs.GetBlob(key).has_value());
  assert(!blobs.Contains(key));
  assert(!bytes->Contains(key));
}

void TestEmptyKeyIsGenerated() {
  auto      repo = std::make_shared<MemoryRepository>();
  BlobStore blobs(repo, std::make_shared<RamArrowStore>());

  auto a = blobs.StoreBlob("", "x", "application/octet-stream");
  auto b = blobs.StoreBlob("", "y", "application/octet-stream");
  assert(a.rfind("blob_", 0) == 0);
  assert(a != b);

  auto generated = BlobStore::GenerateKey("image");
  assert(generated.rfind("image_", 0) == 0);
  assert(generated.size() > std::string("image_").size() + 36);
}

void TestOverwriteReplacesBytesAndIndex() {
  auto      repo = std::make_shared<MemoryRepository>();
  BlobStore blobs(repo, std::make_shared<RamArrowStore>());

  blobs.StoreBlob("k", "first", "text/plain");
  blobs.StoreBlob("k", "second!", "text/markdown");

  auto blob = blobs.GetBlob("k");
  assert(blob->data == "second!");
  assert(blob->mime_type == "text/markdown");
  assert(blobs.ListBlobs().size() == 1);
}

void TestIndexedKeyWithoutBytesReadsAsAbsent() {
  auto      repo  = std::make_shared<MemoryRepository>();
  auto      bytes = std::make_shared<RamArrowStore>();
  BlobStore blobs(repo, bytes);

  blobs.StoreBlob("lost", "data", "image/jpeg");
  bytes->Remove("lost");

  assert(!blobs.GetBlob("lost").has_value());
  assert(!blobs.Contains("lost"));
}

void TestClearRemovesIndexAndBytes() {
  auto      repo  = std::make_shared<MemoryRepository>();
  auto      bytes = std::make_shared<RamArrowStore>();
  BlobStore blobs(repo, bytes);

  blobs.StoreBlob("a", "1", "text/plain");
  blobs.StoreBlob("b", "2", "text/plain");
  blobs.Clear();

  assert(blobs.ListBlobs().empty());
  assert(!bytes->Contains("a"));
  assert(!bytes->Contains("b"));
}

void TestDiskBackendPersistsAcrossInstances() {
  const auto root = FreshDir("persist");
  auto       repo = std::make_shared<MemoryRepository>();

  {
    BlobStore blobs(repo, std::make_shared<DiskArrowStore>(root), /*fsync=*/true);
    blobs.StoreBlob("image_x", "jpegbytes", "image/jpeg");
  }

  auto      disk = std::make_shared<DiskArrowStore>(root);
  BlobStore reopened(repo, disk);
  auto      blob = reopened.GetBlob("image_x");
  assert(blob.has_value());
  assert(blob->data == "jpegbytes");
  assert(disk->Size("image_x") == 9);
  assert(std::filesystem::exists(root / "image_x.bin"));

  reopened.DeleteBlob("image_x");
  assert(!std::filesystem::exists(root / "image_x.bin"));
}

void TestDiskBackendRejectsPathKeys() {
  DiskArrowStore disk(FreshDir("keys"));

  bool threw = false;
  try {
    disk.Write("../escape", gigbook::storage::common::FromBytes("x"), false);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestStoreGetDeleteOnRam();
  TestEmptyKeyIsGenerated();
  TestOverwriteReplacesBytesAndIndex();
  TestIndexedKeyWithoutBytesReadsAsAbsent();
  TestClearRemovesIndexAndBytes();
  TestDiskBackendPersistsAcrossInstances();
  TestDiskBackendRejectsPathKeys();

  std::cout << "gigbook_unit_blob_store: pass\n";
  return 0;
}
