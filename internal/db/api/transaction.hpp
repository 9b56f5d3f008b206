#pragma once

namespace beacon::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - Destructor rolls back if not committed
  - Transactions are serializable with respect to each other

  SQLite:   BEGIN IMMEDIATE under a per-database lock
  Postgres: pqxx::work (unique constraints arbitrate races)
  Memory:   working copy under the repository lock
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsCommitted() const = 0;
};

} // namespace beacon::db
