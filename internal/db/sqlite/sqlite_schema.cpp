#include "sqlite_schema.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/model/collection.hpp"
#include "internal/util/errors.hpp"

namespace gigbook::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  SqliteDB& db_;
};

} // namespace

std::vector<std::string> BootstrapStatements() {
  std::vector<std::string> statements;

  for (auto collection : gigbook::model::kAllCollections) {
    const std::string table(gigbook::model::TableName(collection));
    statements.push_back("CREATE TABLE IF NOT EXISTS " + table +
                         " (id TEXT PRIMARY KEY, json TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);");
  }

  statements.push_back(
      "CREATE TABLE IF NOT EXISTS sync_queue (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, type TEXT NOT NULL, table_name TEXT NOT NULL, item_id TEXT NOT NULL, data TEXT, timestamp_ms INTEGER NOT NULL);");
  statements.push_back("CREATE INDEX IF NOT EXISTS sync_queue_by_time ON sync_queue(timestamp_ms, seq);");
  statements.push_back(
      "CREATE TABLE IF NOT EXISTS blobs (key TEXT PRIMARY KEY, mime_type TEXT NOT NULL, size_bytes INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);");
  statements.push_back(
      "CREATE TABLE IF NOT EXISTS schema_versions (collection TEXT PRIMARY KEY, version INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);");

  return statements;
}

void BootstrapSqliteSchema(SqliteDB& db) {
  SqliteMigrationExecutor executor(db);
  try {
    sql::RunMigrations(executor, BootstrapStatements());
  } catch (const std::exception& e) {
    throw util::StorageUnavailable(db.Path() + ": " + e.what());
  }
}

} // namespace gigbook::db::sqlite
