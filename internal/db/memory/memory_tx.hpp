#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace edgesync::db::memory {

/*
  Works on a private copy of the committed rows. Rows are shared
  pointers, so the copy is proportional to the row count, not payload
  size. Commit swaps the copy in, or throws if another transaction
  committed since Begin().
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return phase_ == Phase::kCommitted;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const;

 private:
  enum class Phase { kOpen, kCommitted, kRolledBack };

  void RequireOpen(const char* op) const;

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                base_version_ = 0;
  Phase                   phase_        = Phase::kOpen;
};

} // namespace edgesync::db::memory
