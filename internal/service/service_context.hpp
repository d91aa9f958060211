#pragma once

#include <memory>

namespace gigbook::core { class EntityStore; }
namespace gigbook::sync { class SyncQueue; }
namespace gigbook::blob { class BlobStore; }
namespace gigbook::media { class MediaStorage; }
namespace gigbook::db { class Repository; }

namespace gigbook::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<gigbook::core::EntityStore> store;
  std::shared_ptr<gigbook::sync::SyncQueue> sync_queue;
  std::shared_ptr<gigbook::blob::BlobStore> blobs;
  std::shared_ptr<gigbook::media::MediaStorage> media;
  std::shared_ptr<gigbook::db::Repository> repository;
};

}
