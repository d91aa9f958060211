#include "storage_factory.hpp"

#include <filesystem>

#include "disk/disk_arrow_store.hpp"
#include "ram/ram_arrow_store.hpp"

namespace gigbook::storage {

StorageBackendPtr StorageFactory::Build(const gigbook::runtime::config::BlobStorageConfig& cfg) {
  switch (cfg.backend_case()) {
    case gigbook::runtime::config::BlobStorageConfig::kDisk:
      return std::make_shared<DiskArrowStore>(std::filesystem::path{cfg.disk().root_path()});
    case gigbook::runtime::config::BlobStorageConfig::kRam:
    case gigbook::runtime::config::BlobStorageConfig::BACKEND_NOT_SET:
      break;
  }
  return std::make_shared<RamArrowStore>();
}

} // namespace gigbook::storage
