#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/db/api/record_repository.hpp"
#include "internal/model/sync_record.hpp"
#include "internal/util/time.hpp"

namespace edgesync::store {

/*
  Local Data Store.

  Durable outbound record storage. Owns the repository and serializes every
  transaction against it, so callers on the ingest thread and the sync
  thread never share a transaction.

  Quota: an incoming record of priority p may push out chained records of
  classes 5 down to max(p, 1), oldest first. P0 is never evicted.
  Retention: EvictExpired drops chained records past their class retention,
  acked or not.

  Evicted ids are reported to the eviction listener after the transaction
  commits and outside the store lock.
*/
class LocalDataStore {
 public:
  using EvictionListener = std::function<void(const std::vector<model::RecordId>&)>;

  LocalDataStore(std::shared_ptr<db::RecordRepository> repository, std::uint64_t quota_bytes);

  // Persists an unchained record. Throws util::StorageFull when it cannot fit.
  void Append(const model::SyncRecord& record);

  // Writes the chain fields of an appended record and the new chain head in
  // one transaction.
  void Link(const model::SyncRecord& chained, const model::ChainState& head);

  std::uint64_t EvictExpired(util::TimePoint now);

  // Chained records of one class in chain order.
  std::vector<model::SyncRecord> IterByPriority(std::uint8_t priority);

  // Every chained record in chain order.
  std::vector<model::SyncRecord> IterChained();

  // Returns false when the record was already gone.
  bool Remove(const model::RecordId& id);

  std::optional<model::SyncRecord> Get(const model::RecordId& id);

  // Appended but not yet chained, creation order.
  std::vector<model::SyncRecord> Pending();

  std::uint64_t     UsedBytes();
  std::uint64_t     CountByPriority(std::uint8_t priority);
  model::ChainState ChainHead();

  std::uint64_t QuotaBytes() const {
    return quota_bytes_;
  }

  void SetEvictionListener(EvictionListener listener);

 private:
  void Notify(const std::vector<model::RecordId>& evicted, const std::vector<std::uint8_t>& priorities);

  std::shared_ptr<db::RecordRepository> repository_;
  std::uint64_t                         quota_bytes_;

  std::mutex       mutex_;
  std::mutex       listener_mutex_;
  EvictionListener listener_;
};

} // namespace edgesync::store
