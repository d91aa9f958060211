#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace gigbook::db::memory {

class MemoryTransaction;

/*
  Process-local repository.

  Used by tests and by the in-memory runtime profile. Data does not
  survive the process.
*/
class MemoryRepository : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRow(Transaction&, const model::EntityRecord&) override;
  std::optional<model::EntityRecord> GetRow(Transaction&, gigbook::model::Collection, const std::string&) override;
  Result UpdateRow(Transaction&, const model::EntityRecord&) override;
  Result DeleteRow(Transaction&, gigbook::model::Collection, const std::string&) override;
  std::vector<model::EntityRecord> ScanRows(Transaction&, gigbook::model::Collection) override;
  uint64_t CountRows(Transaction&, gigbook::model::Collection) override;
  Result ClearRows(Transaction&, gigbook::model::Collection) override;

  std::optional<int> GetSchemaVersion(Transaction&, gigbook::model::Collection) override;
  Result SetSchemaVersion(Transaction&, gigbook::model::Collection, int) override;
  std::vector<model::SchemaVersionRecord> ListSchemaVersions(Transaction&) override;

  Result AppendSyncOperations(Transaction&, std::vector<model::SyncOperationRecord>&) override;
  std::vector<model::SyncOperationRecord> ListSyncOperations(Transaction&) override;
  Result DeleteSyncOperation(Transaction&, const std::string&) override;
  Result ClearSyncOperations(Transaction&) override;

  Result UpsertBlob(Transaction&, const model::BlobRecord&) override;
  std::optional<model::BlobRecord> GetBlob(Transaction&, const std::string&) override;
  Result DeleteBlob(Transaction&, const std::string&) override;
  std::vector<model::BlobRecord> ListBlobs(Transaction&) override;
  Result ClearBlobs(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct Table {
    std::map<uint64_t, model::EntityRecord>   rows;  // insertion sequence -> row
    std::unordered_map<std::string, uint64_t> index; // id -> insertion sequence
    uint64_t                                  next_seq = 1;
  };

  struct State {
    std::unordered_map<gigbook::model::Collection, Table>                      tables;
    std::unordered_map<gigbook::model::Collection, model::SchemaVersionRecord> schema_versions;

    std::vector<model::SyncOperationRecord> sync_queue;
    uint64_t                                next_sync_seq = 1;

    std::map<std::string, model::BlobRecord> blobs;
  };

  std::mutex mutex_;
  State      committed_;
};

} // namespace gigbook::db::memory
