#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace edgesync::db::sqlite {

/*
  BEGIN IMMEDIATE takes the write lock up front, so an append never
  fails halfway through with SQLITE_BUSY after its insert succeeded.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return phase_ == Phase::kCommitted;
  }

 private:
  enum class Phase { kOpen, kCommitted, kRolledBack };

  void RequireOpen(const char* op) const;

  std::shared_ptr<SqliteDB> db_;
  Phase                     phase_ = Phase::kOpen;
};

} // namespace edgesync::db::sqlite
