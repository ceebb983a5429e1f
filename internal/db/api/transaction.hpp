#pragma once

namespace framecomp::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Memory and SQLite serialize transactions; Postgres relies on row locks

  SQLite: BEGIN IMMEDIATE on the shared connection
  Postgres: pqxx::work
  Memory: exclusive lock, undo log replayed on rollback
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
