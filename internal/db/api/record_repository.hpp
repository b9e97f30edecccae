#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/sync_record.hpp"

namespace edgesync::db {

// Lightweight row view used by eviction scans; avoids loading payloads.
struct RecordSummary {
  model::RecordId id{};
  uint8_t         priority      = 0;
  uint64_t        timestamp_ms  = 0;
  uint64_t        sequence      = 0;
  uint64_t        storage_bytes = 0;
};

/*
  Record repository.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - LinkRecord and SaveChainState issued in one transaction commit
    together or not at all; this is what makes chain linking crash safe
  - sequence is UNIQUE across chained rows

  The DB is the source of truth for:
    outbound records (chained and pending)
    chain head
*/

class RecordRepository {
 public:
  virtual ~RecordRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Records
  // ---------------------------------------------------------------------

  virtual Result InsertRecord(Transaction&, const model::SyncRecord&) = 0;

  // Writes chain fields onto an existing unchained row.
  virtual Result LinkRecord(Transaction&, const model::SyncRecord&) = 0;

  virtual std::optional<model::SyncRecord> GetRecord(Transaction&, const model::RecordId& id) = 0;

  // NotFound when the row is already gone.
  virtual Result DeleteRecord(Transaction&, const model::RecordId& id) = 0;

  // Chained rows of one class, ascending sequence.
  virtual std::vector<model::SyncRecord> ListChained(Transaction&, uint8_t priority) = 0;

  // All chained rows, ascending sequence.
  virtual std::vector<model::SyncRecord> ListAllChained(Transaction&) = 0;

  // Unchained rows in insertion order.
  virtual std::vector<model::SyncRecord> ListUnchained(Transaction&) = 0;

  // Chained rows of one class, oldest timestamp first (ties by sequence).
  virtual std::vector<RecordSummary> ListEvictionCandidates(Transaction&, uint8_t priority) = 0;

  // Chained rows of one class with timestamp_ms < cutoff_ms.
  virtual std::vector<RecordSummary> ListExpired(Transaction&, uint8_t priority, uint64_t cutoff_ms) = 0;

  virtual uint64_t TotalStorageBytes(Transaction&) = 0;

  virtual uint64_t CountRecords(Transaction&, uint8_t priority) = 0;

  // ---------------------------------------------------------------------
  // Chain head
  // ---------------------------------------------------------------------

  virtual std::optional<model::ChainState> LoadChainState(Transaction&) = 0;

  virtual Result SaveChainState(Transaction&, const model::ChainState&) = 0;
};

} // namespace edgesync::db
