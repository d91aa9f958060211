#pragma once

namespace gigbook::db {

/*
  Abstract transaction.

  Semantics for every backend:

  - Writes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - Destructor rolls back if not committed
  - A transaction owns the repository's writer lock for its whole
    lifetime, so transactions on one repository never interleave and a
    thread must not open a second one while holding the first

  SQLite: BEGIN IMMEDIATE under the connection lock
  Memory: copy-on-write snapshot under the repository lock
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() has succeeded
  virtual bool IsCommitted() const = 0;
};

} // namespace gigbook::db
