#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/blob/blob_store.hpp"
#include "internal/core/entity_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/media/media_storage.hpp"
#include "internal/schema/schema_migrator.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/contact_service.hpp"
#include "internal/service/content_service.hpp"
#include "internal/service/organization_service.hpp"
#include "internal/service/performance_service.hpp"
#include "internal/storage/storage_backend.hpp"
#include "internal/sync/sync_queue.hpp"

namespace gigbook::factory {

/*
  RuntimeDependencies

  Owns every long-lived object of one process: one repository handle,
  one byte store, and everything built on top of them. The caller owns
  the struct; dropping it closes the store.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;
  storage::StorageBackendPtr blob_bytes;

  std::shared_ptr<sync::SyncQueue> sync_queue;
  std::shared_ptr<core::EntityStore> store;
  std::shared_ptr<blob::BlobStore> blobs;
  std::shared_ptr<media::MediaStorage> media;

  std::shared_ptr<service::ContentService> content_service;
  std::shared_ptr<service::ContactService> contact_service;
  std::shared_ptr<service::PerformanceService> performance_service;
  std::shared_ptr<service::OrganizationService> organization_service;
  std::shared_ptr<service::AdminService> admin_service;

  // migrations applied while opening the store
  std::vector<schema::AppliedStep> applied_migrations;
};

/*
  BuildRuntime

  Composition root: the only place that knows concrete repository and
  storage types. The entity store is initialized (migrations run) before
  this returns; util::MigrationFailed and util::StorageUnavailable
  escape to the caller.
*/
RuntimeDependencies BuildRuntime(const gigbook::runtime::config::RuntimeConfig& config);

// Same, with a caller-supplied migrator.
RuntimeDependencies BuildRuntime(const gigbook::runtime::config::RuntimeConfig& config, const schema::SchemaMigrator& migrator);

} // namespace gigbook::factory
