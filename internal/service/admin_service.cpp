#include "admin_service.hpp"

#include <stdexcept>

#include "internal/blob/blob_store.hpp"
#include "internal/core/entity_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/sync/sync_queue.hpp"
#include "observe.hpp"

namespace gigbook::service {

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store || !ctx_.sync_queue || !ctx_.blobs || !ctx_.repository) {
    throw std::invalid_argument("AdminService requires store, sync queue, blob store and repository");
  }
}

std::vector<v1::SyncOperation> AdminService::SyncQueue() {
  return Observe("AdminService.SyncQueue", [&] { return ctx_.sync_queue->Pending(); });
}

void AdminService::AcknowledgeSyncOperation(const std::string& id) {
  Observe("AdminService.AcknowledgeSyncOperation", [&] { ctx_.sync_queue->Remove(id); });
}

void AdminService::ClearSyncQueue() {
  Observe("AdminService.ClearSyncQueue", [&] { ctx_.sync_queue->Clear(); });
}

std::vector<db::model::SchemaVersionRecord> AdminService::SchemaVersions() {
  auto tx = ctx_.repository->Begin();
  auto versions = ctx_.repository->ListSchemaVersions(*tx);
  tx->Commit();
  return versions;
}

void AdminService::ClearAllData() {
  Observe("AdminService.ClearAllData", [&] {
    for (auto collection : model::kAllCollections) {
      ctx_.store->Clear(collection);
    }
    ctx_.blobs->Clear();
    ctx_.sync_queue->Clear();
    GIGBOOK_LOG_WARN("all local data cleared");
  });
}

} // namespace gigbook::service
