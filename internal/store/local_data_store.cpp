#include "local_data_store.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

#include "internal/model/priority.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::store {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + result.Describe();
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    case db::ErrorCode::Full:
      throw util::StorageFull(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace

LocalDataStore::LocalDataStore(std::shared_ptr<db::RecordRepository> repository, std::uint64_t quota_bytes)
    : repository_(std::move(repository)), quota_bytes_(quota_bytes) {
  if (!repository_) {
    throw std::invalid_argument("LocalDataStore: repository is null");
  }
}

void LocalDataStore::SetEvictionListener(EvictionListener listener) {
  std::lock_guard lock(listener_mutex_);
  listener_ = std::move(listener);
}

void LocalDataStore::Append(const model::SyncRecord& record) {
  if (!model::IsValidPriority(record.priority)) {
    throw std::invalid_argument("priority out of range: " + std::to_string(record.priority));
  }

  std::vector<model::RecordId> evicted;
  std::vector<std::uint8_t>    evicted_priorities;

  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();

    const auto needed = record.StorageBytes();
    auto       used   = repository_->TotalStorageBytes(*tx);

    if (used + needed > quota_bytes_) {
      const std::uint8_t floor = std::max<std::uint8_t>(record.priority, 1);
      for (int cls = model::kLowestPriority; cls >= floor && used + needed > quota_bytes_; --cls) {
        for (const auto& victim : repository_->ListEvictionCandidates(*tx, static_cast<std::uint8_t>(cls))) {
          if (used + needed <= quota_bytes_) break;
          ThrowIfDbError(repository_->DeleteRecord(*tx, victim.id), "evict for quota");
          used -= std::min(used, victim.storage_bytes);
          evicted.push_back(victim.id);
          evicted_priorities.push_back(victim.priority);
        }
      }

      if (used + needed > quota_bytes_) {
        tx->Rollback();
        EDGESYNC_LOG_ERROR("storage full, append rejected",
                           {observability::AlertField("storage_full"), observability::StringField("record_id", util::ToString(record.id)),
                            observability::IntField("priority", record.priority), observability::UintField("needed_bytes", needed),
                            observability::UintField("used_bytes", used), observability::UintField("quota_bytes", quota_bytes_)});
        throw util::StorageFull("no room for record " + util::ToString(record.id) + " (priority " + std::to_string(record.priority) +
                                ", " + std::to_string(needed) + " bytes)");
      }
    }

    ThrowIfDbError(repository_->InsertRecord(*tx, record), "append record");
    tx->Commit();
  }

  if (!evicted.empty()) {
    EDGESYNC_LOG_WARN("quota eviction", {observability::UintField("evicted", evicted.size()),
                                         observability::IntField("for_priority", record.priority)});
    Notify(evicted, evicted_priorities);
  }
}

void LocalDataStore::Link(const model::SyncRecord& chained, const model::ChainState& head) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->LinkRecord(*tx, chained), "link record " + util::ToString(chained.id));
  ThrowIfDbError(repository_->SaveChainState(*tx, head), "save chain state");
  tx->Commit();
}

std::uint64_t LocalDataStore::EvictExpired(util::TimePoint now) {
  const auto now_ms = util::ToUnixMillis(now);

  std::vector<model::RecordId> evicted;
  std::vector<std::uint8_t>    evicted_priorities;

  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();

    for (const auto& cls : model::kPriorityTable) {
      if (!cls.retention) continue;

      const auto retention_ms = static_cast<std::uint64_t>(cls.retention->count());
      if (now_ms <= retention_ms) continue;

      for (const auto& victim : repository_->ListExpired(*tx, cls.priority, now_ms - retention_ms)) {
        ThrowIfDbError(repository_->DeleteRecord(*tx, victim.id), "evict expired");
        evicted.push_back(victim.id);
        evicted_priorities.push_back(victim.priority);
      }
    }

    if (evicted.empty()) {
      tx->Rollback();
      return 0;
    }
    tx->Commit();
  }

  EDGESYNC_LOG_INFO("retention eviction", {observability::UintField("evicted", evicted.size())});
  Notify(evicted, evicted_priorities);
  return evicted.size();
}

void LocalDataStore::Notify(const std::vector<model::RecordId>& evicted, const std::vector<std::uint8_t>& priorities) {
  std::array<std::uint64_t, model::kPriorityCount> per_class{};
  for (auto p : priorities) per_class[p]++;
  for (std::uint8_t p = 0; p < model::kPriorityCount; ++p) {
    if (per_class[p] > 0) observability::Metrics::Instance().RecordEvicted(p, per_class[p]);
  }

  EvictionListener listener;
  {
    std::lock_guard lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) listener(evicted);
}

std::vector<model::SyncRecord> LocalDataStore::IterByPriority(std::uint8_t priority) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->ListChained(*tx, priority);
}

std::vector<model::SyncRecord> LocalDataStore::IterChained() {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->ListAllChained(*tx);
}

bool LocalDataStore::Remove(const model::RecordId& id) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  const auto      result = repository_->DeleteRecord(*tx, id);
  if (result.code == db::ErrorCode::NotFound) {
    return false;
  }
  ThrowIfDbError(result, "remove record " + util::ToString(id));
  tx->Commit();
  return true;
}

std::optional<model::SyncRecord> LocalDataStore::Get(const model::RecordId& id) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->GetRecord(*tx, id);
}

std::vector<model::SyncRecord> LocalDataStore::Pending() {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->ListUnchained(*tx);
}

std::uint64_t LocalDataStore::UsedBytes() {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->TotalStorageBytes(*tx);
}

std::uint64_t LocalDataStore::CountByPriority(std::uint8_t priority) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->CountRecords(*tx, priority);
}

model::ChainState LocalDataStore::ChainHead() {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->LoadChainState(*tx).value_or(model::ChainState{});
}

} // namespace edgesync::store
