#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace edgesync::db::memory {

namespace {

RecordSummary Summarize(const model::SyncRecord& r) {
  RecordSummary s;
  s.id            = r.id;
  s.priority      = r.priority;
  s.timestamp_ms  = r.timestamp_ms;
  s.sequence      = r.sequence;
  s.storage_bytes = r.StorageBytes();
  return s;
}

bool OlderFirst(const RecordSummary& a, const RecordSummary& b) {
  if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms < b.timestamp_ms;
  return a.sequence < b.sequence;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertRecord(Transaction& t, const model::SyncRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.records.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);

  auto row   = std::make_shared<model::SyncRecord>(r);
  row->sequence = 0;
  s.records[r.id] = Row{std::move(row), s.next_insert_order++};
  s.storage_bytes += r.StorageBytes();
  return Result::Ok();
}

Result MemoryRepository::LinkRecord(Transaction& t, const model::SyncRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.records.find(r.id);
  if (it == s.records.end() || it->second.record->IsChained()) {
    return Result::Err(ErrorCode::Conflict, "record missing or already chained");
  }
  if (s.by_sequence.contains(r.sequence)) {
    return Result::Err(ErrorCode::ConstraintViolation, "sequence already used");
  }

  auto linked       = std::make_shared<model::SyncRecord>(*it->second.record);
  linked->sequence  = r.sequence;
  linked->prev_hash = r.prev_hash;
  linked->hash      = r.hash;
  linked->signature = r.signature;

  it->second.record       = std::move(linked);
  s.by_sequence[r.sequence] = r.id;
  return Result::Ok();
}

std::optional<model::SyncRecord> MemoryRepository::GetRecord(Transaction& t, const model::RecordId& id) {
  const auto& s  = TX(t).View();
  auto        it = s.records.find(id);
  if (it == s.records.end()) return std::nullopt;
  return *it->second.record;
}

Result MemoryRepository::DeleteRecord(Transaction& t, const model::RecordId& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.records.find(id);
  if (it == s.records.end()) return Result::Err(ErrorCode::NotFound);

  const auto& rec = *it->second.record;
  if (rec.IsChained()) s.by_sequence.erase(rec.sequence);
  s.storage_bytes -= rec.StorageBytes();
  s.records.erase(it);
  return Result::Ok();
}

std::vector<model::SyncRecord> MemoryRepository::ListChained(Transaction& t, uint8_t priority) {
  const auto&                    s = TX(t).View();
  std::vector<model::SyncRecord> out;
  for (const auto& [seq, id] : s.by_sequence) {
    const auto& rec = *s.records.at(id).record;
    if (rec.priority == priority) out.push_back(rec);
  }
  return out;
}

std::vector<model::SyncRecord> MemoryRepository::ListAllChained(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::SyncRecord> out;
  out.reserve(s.by_sequence.size());
  for (const auto& [seq, id] : s.by_sequence) {
    out.push_back(*s.records.at(id).record);
  }
  return out;
}

std::vector<model::SyncRecord> MemoryRepository::ListUnchained(Transaction& t) {
  const auto&       s = TX(t).View();
  std::vector<const Row*> pending;
  for (const auto& [_, row] : s.records) {
    if (!row.record->IsChained()) pending.push_back(&row);
  }
  std::sort(pending.begin(), pending.end(),
            [](const Row* a, const Row* b) { return a->insert_order < b->insert_order; });

  std::vector<model::SyncRecord> out;
  out.reserve(pending.size());
  for (const Row* row : pending) out.push_back(*row->record);
  return out;
}

std::vector<RecordSummary> MemoryRepository::ListEvictionCandidates(Transaction& t, uint8_t priority) {
  const auto&                s = TX(t).View();
  std::vector<RecordSummary> out;
  for (const auto& [seq, id] : s.by_sequence) {
    const auto& rec = *s.records.at(id).record;
    if (rec.priority == priority) out.push_back(Summarize(rec));
  }
  std::stable_sort(out.begin(), out.end(), OlderFirst);
  return out;
}

std::vector<RecordSummary> MemoryRepository::ListExpired(Transaction& t, uint8_t priority, uint64_t cutoff_ms) {
  auto candidates = ListEvictionCandidates(t, priority);
  candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                  [cutoff_ms](const RecordSummary& s) { return s.timestamp_ms >= cutoff_ms; }),
                   candidates.end());
  return candidates;
}

uint64_t MemoryRepository::TotalStorageBytes(Transaction& t) {
  return TX(t).View().storage_bytes;
}

uint64_t MemoryRepository::CountRecords(Transaction& t, uint8_t priority) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(std::count_if(s.records.begin(), s.records.end(), [priority](const auto& kv) {
    return kv.second.record->priority == priority;
  }));
}

std::optional<model::ChainState> MemoryRepository::LoadChainState(Transaction& t) {
  return TX(t).View().chain;
}

Result MemoryRepository::SaveChainState(Transaction& t, const model::ChainState& state) {
  TX(t).Mutable().chain = state;
  return Result::Ok();
}

} // namespace edgesync::db::memory
