#pragma once

#include <memory>

#include "internal/db/api/record_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace edgesync::db::sqlite {

class SqliteRepository final : public db::RecordRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates tables and indexes if missing. Idempotent.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRecord(Transaction&, const model::SyncRecord&) override;
  Result LinkRecord(Transaction&, const model::SyncRecord&) override;
  std::optional<model::SyncRecord> GetRecord(Transaction&, const model::RecordId&) override;
  Result DeleteRecord(Transaction&, const model::RecordId&) override;

  std::vector<model::SyncRecord> ListChained(Transaction&, uint8_t priority) override;
  std::vector<model::SyncRecord> ListAllChained(Transaction&) override;
  std::vector<model::SyncRecord> ListUnchained(Transaction&) override;
  std::vector<RecordSummary> ListEvictionCandidates(Transaction&, uint8_t priority) override;
  std::vector<RecordSummary> ListExpired(Transaction&, uint8_t priority, uint64_t cutoff_ms) override;

  uint64_t TotalStorageBytes(Transaction&) override;
  uint64_t CountRecords(Transaction&, uint8_t priority) override;

  std::optional<model::ChainState> LoadChainState(Transaction&) override;
  Result SaveChainState(Transaction&, const model::ChainState&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
