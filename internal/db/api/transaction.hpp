#pragma once

namespace signoff::db {

/*
  Abstract transaction.

  Every backend guarantees:

  - writes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - the destructor rolls back if not committed

  A report run reads the whole snapshot inside one transaction, so
  concurrent loaders never produce a half-applied view.

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: copy-on-write state with a version check at commit
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace signoff::db
