#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace gigbook::db::sqlite {

/*
  Repository over a single SQLite file.

  One table per collection (id, json body, timestamps); scans follow
  rowid, which is insertion order.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace gigbook::db::sqlite
