#pragma once

namespace edgesync::db {

/*
  Unit of atomicity for the record store.

  An append (insert + chain link + chain state), an eviction batch and an
  acknowledgement removal each run inside one transaction, so a crash can
  never leave a linked record without its chain state or the reverse.

  Writes become visible on Commit(). A transaction destroyed without
  Commit() rolls back.

  SQLite: BEGIN IMMEDIATE on the shared connection.
  Memory: private copy of the committed state, swapped in on commit.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace edgesync::db
