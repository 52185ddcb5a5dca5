#pragma once

namespace sealer::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws util::Conflict when a concurrent writer invalidated
    the snapshot this transaction read from

  SQLite: BEGIN IMMEDIATE, one transaction per connection at a time
  Postgres: pqxx::work
  Memory: snapshot copy-on-write with a commit version check
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

}
