#include "memory_tx.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace edgesync::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

void MemoryTransaction::RequireOpen(const char* op) const {
  if (phase_ != Phase::kOpen) {
    throw util::InvalidState(std::string("memory transaction already finished: ") + op);
  }
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  RequireOpen("write");
  return working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  RequireOpen("read");
  return working_;
}

void MemoryTransaction::Commit() {
  RequireOpen("commit");
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw util::InvalidState("memory transaction conflict: outbox changed since begin");
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
  phase_ = Phase::kCommitted;
}

void MemoryTransaction::Rollback() {
  RequireOpen("rollback");
  phase_ = Phase::kRolledBack;
}

} // namespace edgesync::db::memory
