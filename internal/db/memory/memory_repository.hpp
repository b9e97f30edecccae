#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/db/api/record_repository.hpp"

namespace edgesync::db::memory {

class MemoryTransaction;

/*
  Volatile repository for tests and for nodes configured without a disk.
  Rows are held by shared_ptr so that a transaction snapshot copies
  pointers, not payloads.
*/
class MemoryRepository final : public db::RecordRepository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct Row {
    std::shared_ptr<const model::SyncRecord> record;
    uint64_t                                 insert_order = 0;
  };

  struct State {
    std::map<model::RecordId, Row>      records;
    std::map<uint64_t, model::RecordId> by_sequence;
    std::optional<model::ChainState>    chain;
    uint64_t                            next_insert_order = 1;
    uint64_t                            storage_bytes     = 0;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
