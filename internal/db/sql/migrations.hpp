#pragma once

#include <string>
#include <vector>

namespace gigbook::db::sql {

/*
  Backend-agnostic DDL execution.

  Each SQL backend implements ExecuteSQL(). These statements create the
  physical tables; row-level schema evolution of entity bodies is the
  job of schema::SchemaMigrator.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs statements in order. Every statement must be idempotent
  (CREATE ... IF NOT EXISTS) because this runs on every open.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace gigbook::db::sql
