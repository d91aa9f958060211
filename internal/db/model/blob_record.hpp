#pragma once

#include <cstdint>
#include <string>

namespace gigbook::db::model {

/*
  Blob index row. Bytes live in the storage backend under the same key.
*/
struct BlobRecord {
  std::string key;
  std::string mime_type;
  uint64_t    size_bytes    = 0;
  int64_t     created_at_ms = 0;
};

} // namespace gigbook::db::model
