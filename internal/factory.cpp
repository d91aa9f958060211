#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schema/builtin_migrations.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/storage_factory.hpp"
#if GIGBOOK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace gigbook::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const gigbook::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if GIGBOOK_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSqliteSchema(*sqlite_db);
    GIGBOOK_LOG_INFO("sqlite store opened", {observability::StringField("path", database.sqlite().path()),
                                            observability::BoolField("wal_mode", database.sqlite().wal_mode())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  GIGBOOK_LOG_INFO("memory store opened");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

RuntimeDependencies BuildRuntime(const gigbook::runtime::config::RuntimeConfig& config) {
  return BuildRuntime(config, schema::DefaultMigrator());
}

/*
    Build full application dependency graph
*/
RuntimeDependencies BuildRuntime(const gigbook::runtime::config::RuntimeConfig& config, const schema::SchemaMigrator& migrator) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Storage backends
  // ------------------------------------------------------------------
  deps.repository = BuildRepository(config);
  deps.blob_bytes = storage::StorageFactory::Build(config.blobs());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  deps.sync_queue = std::make_shared<sync::SyncQueue>(deps.repository);
  deps.store = std::make_shared<core::EntityStore>(deps.repository, deps.sync_queue);
  deps.applied_migrations = deps.store->Initialize(migrator);

  const bool fsync = config.blobs().has_disk() && config.blobs().disk().fsync();
  deps.blobs = std::make_shared<blob::BlobStore>(deps.repository, deps.blob_bytes, fsync);
  deps.media = std::make_shared<media::MediaStorage>(deps.blobs, config.media());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store = deps.store;
  ctx.sync_queue = deps.sync_queue;
  ctx.blobs = deps.blobs;
  ctx.media = deps.media;
  ctx.repository = deps.repository;

  deps.content_service = std::make_shared<service::ContentService>(ctx);
  deps.contact_service = std::make_shared<service::ContactService>(ctx);
  deps.performance_service = std::make_shared<service::PerformanceService>(ctx);
  deps.organization_service = std::make_shared<service::OrganizationService>(ctx);
  deps.admin_service = std::make_shared<service::AdminService>(ctx);

  GIGBOOK_LOG_INFO("runtime ready", {observability::StringField("blob_backend", deps.blob_bytes->Kind())});
  return deps;
}

} // namespace gigbook::factory
