#pragma once

#include <string>
#include <vector>

#include "gigbook/v1.hpp"
#include "internal/db/model/schema_version_record.hpp"
#include "service_context.hpp"

namespace gigbook::service {

/*
  Outbox access for the sync collaborator plus maintenance operations.
*/
class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  // FIFO by timestamp
  std::vector<v1::SyncOperation> SyncQueue();

  // Acknowledgement never touches entity rows.
  void AcknowledgeSyncOperation(const std::string& id);
  void ClearSyncQueue();

  std::vector<db::model::SchemaVersionRecord> SchemaVersions();

  // Every collection, every blob and the outbox. No sync operations are recorded.
  void ClearAllData();

private:
  ServiceContext ctx_;
};

}
