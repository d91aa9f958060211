#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace gigbook::db::sqlite {

// CREATE TABLE IF NOT EXISTS statements for every table the repository touches.
std::vector<std::string> BootstrapStatements();

// Runs BootstrapStatements() against an open connection.
void BootstrapSqliteSchema(SqliteDB& db);

} // namespace gigbook::db::sqlite
