#include "migrations.hpp"

#include <stdexcept>

namespace gigbook::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (size_t i = 0; i < ordered_sql.size(); ++i) {
    try {
      executor.ExecuteSQL(ordered_sql[i]);
    } catch (const std::exception& e) {
      throw std::runtime_error("bootstrap statement " + std::to_string(i) + " failed: " + e.what());
    }
  }
}

} // namespace gigbook::db::sql
