#pragma once

#include "config/config.pb.h"
#include "storage_backend.hpp"

namespace gigbook::storage {

/*
  Builds the blob byte backend named by configuration.

      auto bytes = StorageFactory::Build(config.blobs());
      bytes->Write(key, buffer, fsync);
*/

class StorageFactory {
public:
  static StorageBackendPtr Build(const gigbook::runtime::config::BlobStorageConfig& cfg);
};

} // namespace gigbook::storage
