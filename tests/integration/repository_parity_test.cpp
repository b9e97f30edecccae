#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/record_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "tests/support/test_records.hpp"

namespace {

using edgesync::db::ErrorCode;
using edgesync::db::RecordRepository;
using edgesync::db::memory::MemoryRepository;
using edgesync::model::ChainState;
using edgesync::model::SyncRecord;
using edgesync::testing::MakeRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                             name;
  std::function<std::shared_ptr<RecordRepository>()>      make_repository;
  std::function<bool()>                                   supports_restart;
  std::function<void(std::shared_ptr<RecordRepository>&)> restart;
  std::function<void()>                                   cleanup;
};

SyncRecord Linked(SyncRecord record, uint64_t sequence) {
  record.sequence = sequence;
  record.prev_hash.fill(static_cast<uint8_t>(sequence - 1));
  record.hash.fill(static_cast<uint8_t>(sequence));
  record.signature.fill(0x5A);
  return record;
}

void VerifyInsertLinkGetDelete(RecordRepository& repo) {
  auto tx = repo.Begin();

  const auto record = MakeRecord(2, 1000, "insert-link");
  assert(repo.InsertRecord(*tx, record));
  assert(repo.InsertRecord(*tx, record).code == ErrorCode::AlreadyExists);

  auto fetched = repo.GetRecord(*tx, record.id);
  assert(fetched.has_value());
  assert(!fetched->IsChained());
  assert(fetched->payload == record.payload);
  assert(fetched->digest == record.digest);
  assert(repo.ListUnchained(*tx).size() == 1);

  const auto linked = Linked(record, 1);
  assert(repo.LinkRecord(*tx, linked));
  // chain fields are written exactly once
  assert(repo.LinkRecord(*tx, Linked(record, 2)).code == ErrorCode::Conflict);

  fetched = repo.GetRecord(*tx, record.id);
  assert(fetched->sequence == 1);
  assert(fetched->hash == linked.hash);
  assert(fetched->prev_hash == linked.prev_hash);
  assert(fetched->signature == linked.signature);
  assert(fetched->msg_type == record.msg_type);
  assert(repo.ListUnchained(*tx).empty());

  assert(repo.TotalStorageBytes(*tx) == record.StorageBytes());
  assert(repo.CountRecords(*tx, 2) == 1);

  assert(repo.DeleteRecord(*tx, record.id));
  assert(repo.DeleteRecord(*tx, record.id).code == ErrorCode::NotFound);
  assert(!repo.GetRecord(*tx, record.id).has_value());
  assert(repo.TotalStorageBytes(*tx) == 0);

  tx->Commit();
}

void VerifyOrderingQueries(RecordRepository& repo) {
  auto tx = repo.Begin();

  // sequence order and age order disagree on purpose
  const auto a = Linked(MakeRecord(4, 3000, "a"), 10);
  const auto b = Linked(MakeRecord(4, 1000, "b"), 11);
  const auto c = Linked(MakeRecord(1, 2000, "c"), 12);
  for (const auto& r : {a, b, c}) {
    auto unchained     = r;
    unchained.sequence = 0;
    assert(repo.InsertRecord(*tx, unchained));
    assert(repo.LinkRecord(*tx, r));
  }

  const auto p4 = repo.ListChained(*tx, 4);
  assert(p4.size() == 2 && p4[0].id == a.id && p4[1].id == b.id);

  const auto all = repo.ListAllChained(*tx);
  assert(all.size() == 3 && all[2].id == c.id);

  const auto candidates = repo.ListEvictionCandidates(*tx, 4);
  assert(candidates.size() == 2);
  assert(candidates[0].id == b.id);
  assert(candidates[0].storage_bytes == b.StorageBytes());

  const auto expired = repo.ListExpired(*tx, 4, 2000);
  assert(expired.size() == 1 && expired[0].id == b.id);
  assert(repo.ListExpired(*tx, 1, 2000).empty());

  // unchained rows come back in insertion order
  const auto u1 = MakeRecord(0, 9000, "u1");
  const auto u2 = MakeRecord(0, 100, "u2");
  assert(repo.InsertRecord(*tx, u1));
  assert(repo.InsertRecord(*tx, u2));
  const auto pending = repo.ListUnchained(*tx);
  assert(pending.size() == 2 && pending[0].id == u1.id && pending[1].id == u2.id);

  tx->Rollback();
}

void VerifyChainState(RecordRepository& repo) {
  auto tx = repo.Begin();
  assert(!repo.LoadChainState(*tx).has_value());

  ChainState head;
  head.last_sequence = 7;
  head.last_hash.fill(0x77);
  assert(repo.SaveChainState(*tx, head));

  head.last_sequence = 8;
  assert(repo.SaveChainState(*tx, head));

  const auto loaded = repo.LoadChainState(*tx);
  assert(loaded.has_value());
  assert(loaded->last_sequence == 8);
  assert(loaded->last_hash == head.last_hash);
  tx->Rollback();
}

void VerifyRollbackBehavior(RecordRepository& repo) {
  const auto record = MakeRecord(3, 1000, "rolled-back");
  {
    auto tx = repo.Begin();
    assert(repo.InsertRecord(*tx, record));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertRecord(*tx, record));
    // destructor rolls back
  }

  auto tx = repo.Begin();
  assert(!repo.GetRecord(*tx, record.id).has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo   = backend.make_repository();
  auto record = MakeRecord(0, NowMs(), "durable");
  {
    auto tx = repo->Begin();
    assert(repo->InsertRecord(*tx, record));
    assert(repo->LinkRecord(*tx, Linked(record, 1)));
    assert(repo->SaveChainState(*tx, ChainState{1, Linked(record, 1).hash}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx      = repo->Begin();
  auto fetched = repo->GetRecord(*tx, record.id);
  assert(fetched.has_value());
  assert(fetched->sequence == 1);
  assert(repo->LoadChainState(*tx)->last_sequence == 1);
  assert(repo->DeleteRecord(*tx, record.id));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<RecordRepository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("edgesync_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<edgesync::db::sqlite::SqliteDB>(db_path);
    edgesync::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<edgesync::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<RecordRepository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  {
    auto repo = backend.make_repository();
    VerifyInsertLinkGetDelete(*repo);
    VerifyOrderingQueries(*repo);
    VerifyChainState(*repo);
    VerifyRollbackBehavior(*repo);
  }
  VerifyRestartDurability(backend);
  backend.cleanup();

  std::cout << "backend " << backend.name << ": ok\n";
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "edgesync_integration_repository_parity: pass\n";
  return 0;
}
