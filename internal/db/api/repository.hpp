#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/blob_record.hpp"
#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/schema_version_record.hpp"
#include "internal/db/model/sync_operation_record.hpp"
#include "internal/model/collection.hpp"
#include "result.hpp"
#include "transaction.hpp"

namespace gigbook::db {

/*
  Row store underneath the entity store.

  Entity rows are opaque JSON bodies grouped by collection. Besides the
  entity tables the repository keeps three internal tables: the sync
  outbox, the blob index and per-collection schema versions.

  Absence is never an error on reads (std::optional / empty vector).
  Engine failures on reads throw util::StorageUnavailable; writes report
  them through Result.
*/
class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------
  // Entity rows
  // ---------------------------------------------------------------
  // AlreadyExists if (collection, id) is taken
  virtual Result InsertRow(Transaction&, const model::EntityRecord&) = 0;
  virtual std::optional<model::EntityRecord> GetRow(Transaction&, gigbook::model::Collection, const std::string& id) = 0;
  // NotFound if the row is absent
  virtual Result UpdateRow(Transaction&, const model::EntityRecord&) = 0;
  // OK whether or not the row existed
  virtual Result DeleteRow(Transaction&, gigbook::model::Collection, const std::string& id) = 0;
  // insertion order
  virtual std::vector<model::EntityRecord> ScanRows(Transaction&, gigbook::model::Collection) = 0;
  virtual uint64_t CountRows(Transaction&, gigbook::model::Collection) = 0;
  virtual Result ClearRows(Transaction&, gigbook::model::Collection) = 0;

  // ---------------------------------------------------------------
  // Schema versions
  // ---------------------------------------------------------------
  virtual std::optional<int> GetSchemaVersion(Transaction&, gigbook::model::Collection) = 0;
  virtual Result SetSchemaVersion(Transaction&, gigbook::model::Collection, int version) = 0;
  virtual std::vector<model::SchemaVersionRecord> ListSchemaVersions(Transaction&) = 0;

  // ---------------------------------------------------------------
  // Sync outbox
  // ---------------------------------------------------------------
  // assigns seq to every record, strictly increasing across calls
  virtual Result AppendSyncOperations(Transaction&, std::vector<model::SyncOperationRecord>& operations) = 0;
  // ordered by (timestamp_ms, seq)
  virtual std::vector<model::SyncOperationRecord> ListSyncOperations(Transaction&) = 0;
  virtual Result DeleteSyncOperation(Transaction&, const std::string& id) = 0;
  virtual Result ClearSyncOperations(Transaction&) = 0;

  // ---------------------------------------------------------------
  // Blob index
  // ---------------------------------------------------------------
  virtual Result UpsertBlob(Transaction&, const model::BlobRecord&) = 0;
  virtual std::optional<model::BlobRecord> GetBlob(Transaction&, const std::string& key) = 0;
  virtual Result DeleteBlob(Transaction&, const std::string& key) = 0;
  // ordered by key
  virtual std::vector<model::BlobRecord> ListBlobs(Transaction&) = 0;
  virtual Result ClearBlobs(Transaction&) = 0;
};

} // namespace gigbook::db
