#include "sqlite_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (phase_ != Phase::kOpen) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    EDGESYNC_LOG_ERROR("outbox rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::RequireOpen(const char* op) const {
  if (phase_ != Phase::kOpen) {
    throw util::InvalidState(std::string("outbox transaction already finished: ") + op);
  }
}

void SqliteTransaction::Commit() {
  RequireOpen("commit");
  db_->Exec("COMMIT;");
  phase_ = Phase::kCommitted;
}

void SqliteTransaction::Rollback() {
  RequireOpen("rollback");
  phase_ = Phase::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace edgesync::db::sqlite
