#pragma once

namespace swarm::db {

/*
  Abstract transaction.

  Semantics:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite write: BEGIN IMMEDIATE
  SQLite read:  BEGIN DEFERRED
*/

enum class TxMode { kRead, kWrite };

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
