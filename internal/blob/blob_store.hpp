#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/storage/storage_backend.hpp"

namespace gigbook::blob {

struct StoredBlob {
  std::string key;
  std::string data;
  std::string mime_type;
  uint64_t    size_bytes    = 0;
  int64_t     created_at_ms = 0;
};

/*
  Key-addressed binary storage.

  Bytes live in a StorageBackend, the metadata row (mime type, size,
  creation time) in the repository's blob index. The two writes are
  ordered so that a crash between them leaves at worst orphaned bytes,
  never a metadata row pointing at nothing:

    store:  bytes → index
    delete: index → bytes

  Absence is std::optional, never an error. Storage failures throw
  util::StorageUnavailable.
*/
class BlobStore {
 public:
  BlobStore(std::shared_ptr<db::Repository> repository, storage::StorageBackendPtr bytes, bool fsync = false);

  // Empty key → a generated "blob_" key. Overwrites an existing key.
  std::string StoreBlob(std::string key, std::string data, const std::string& mime_type);

  std::optional<StoredBlob> GetBlob(const std::string& key);

  bool Contains(const std::string& key);

  // Idempotent.
  void DeleteBlob(const std::string& key);

  std::vector<db::model::BlobRecord> ListBlobs();

  // Removes every indexed blob.
  void Clear();

  // <kind>_<uuid>_<unix-ms>
  static std::string GenerateKey(std::string_view kind);

 private:
  std::shared_ptr<db::Repository> repository_;
  storage::StorageBackendPtr      bytes_;
  bool                            fsync_;
};

} // namespace gigbook::blob
