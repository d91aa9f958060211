#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace gigbook::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  One connection per process. Transactions take WriterMutex() for
  their lifetime so callers on different threads never interleave
  statements inside each other's BEGIN/COMMIT.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  // Execute a SQL string (pragmas, DDL, transaction control)
  void Exec(const std::string& sql);

  // Configure PRAGMAs (journal mode, foreign keys, busy timeout)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

} // namespace gigbook::db::sqlite
