#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cstring>
#include <string>
#include <vector>

namespace edgesync::db::sqlite {

using edgesync::db::ErrorCode;
using edgesync::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt PrepareOrNull(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return Stmt(nullptr);
  }
  return Stmt(st);
}

template <size_t N>
void BindBlob(sqlite3_stmt* st, int idx, const std::array<uint8_t, N>& bytes) {
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(N), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   len  = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(len)) : std::string{};
}

template <size_t N>
std::array<uint8_t, N> ColArray(sqlite3_stmt* st, int col) {
  std::array<uint8_t, N> out{};
  const void*            data = sqlite3_column_blob(st, col);
  if (data && sqlite3_column_bytes(st, col) == static_cast<int>(N)) {
    std::memcpy(out.data(), data, N);
  }
  return out;
}

constexpr const char* kRecordColumns =
    "id,priority,msg_type,payload,digest,timestamp_ms,sequence,prev_hash,hash,signature";

model::SyncRecord ReadRecord(sqlite3_stmt* st) {
  model::SyncRecord r;
  r.id           = ColArray<16>(st, 0);
  r.priority     = static_cast<uint8_t>(ColI32(st, 1));
  r.msg_type     = static_cast<edgesync::v1::MessageType>(ColI32(st, 2));
  r.payload      = ColBlob(st, 3);
  r.digest       = ColArray<32>(st, 4);
  r.timestamp_ms = ColU64(st, 5);
  if (sqlite3_column_type(st, 6) != SQLITE_NULL) {
    r.sequence  = ColU64(st, 6);
    r.prev_hash = ColArray<32>(st, 7);
    r.hash      = ColArray<32>(st, 8);
    r.signature = ColArray<64>(st, 9);
  }
  return r;
}

RecordSummary ReadSummary(sqlite3_stmt* st) {
  RecordSummary s;
  s.id            = ColArray<16>(st, 0);
  s.priority      = static_cast<uint8_t>(ColI32(st, 1));
  s.timestamp_ms  = ColU64(st, 2);
  s.sequence      = ColU64(st, 3);
  s.storage_bytes = ColU64(st, 4);
  return s;
}

std::vector<model::SyncRecord> CollectRecords(sqlite3_stmt* st) {
  std::vector<model::SyncRecord> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadRecord(st));
  }
  return out;
}

std::vector<RecordSummary> CollectSummaries(sqlite3_stmt* st) {
  std::vector<RecordSummary> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadSummary(st));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS sync_record ("
      " row_id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " id BLOB NOT NULL UNIQUE,"
      " priority INTEGER NOT NULL CHECK (priority BETWEEN 0 AND 5),"
      " msg_type INTEGER NOT NULL,"
      " payload BLOB NOT NULL,"
      " digest BLOB NOT NULL,"
      " timestamp_ms INTEGER NOT NULL,"
      " sequence INTEGER UNIQUE,"
      " prev_hash BLOB,"
      " hash BLOB,"
      " signature BLOB,"
      " storage_bytes INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_sync_record_chain ON sync_record(priority, sequence);",
      "CREATE INDEX IF NOT EXISTS idx_sync_record_age ON sync_record(priority, timestamp_ms);",
      "CREATE TABLE IF NOT EXISTS chain_state (id INTEGER PRIMARY KEY CHECK (id = 1), last_sequence INTEGER NOT NULL, last_hash BLOB NOT NULL);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_FULL:
            return Result::Err(ErrorCode::Full, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result SqliteRepository::InsertRecord(Transaction& t, const model::SyncRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO sync_record(id,priority,msg_type,payload,digest,timestamp_ms,storage_bytes) "
        "VALUES(?,?,?,?,?,?,?);";

    auto st = PrepareOrNull(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st.get(), 1, r.id);
    BindI32(st.get(), 2, r.priority);
    BindI32(st.get(), 3, static_cast<int>(r.msg_type));
    BindBlob(st.get(), 4, r.payload);
    BindBlob(st.get(), 5, r.digest);
    BindU64(st.get(), 6, r.timestamp_ms);
    BindU64(st.get(), 7, r.StorageBytes());

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    return Translate(db, rc);
}

Result SqliteRepository::LinkRecord(Transaction& t, const model::SyncRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE sync_record SET sequence=?,prev_hash=?,hash=?,signature=? "
        "WHERE id=? AND sequence IS NULL;";

    auto st = PrepareOrNull(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, r.sequence);
    BindBlob(st.get(), 2, r.prev_hash);
    BindBlob(st.get(), 3, r.hash);
    BindBlob(st.get(), 4, r.signature);
    BindBlob(st.get(), 5, r.id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) != 1)
        return Result::Err(ErrorCode::Conflict, "record missing or already chained");
    return Result::Ok();
}

std::optional<model::SyncRecord>
SqliteRepository::GetRecord(Transaction& t, const model::RecordId& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kRecordColumns + " FROM sync_record WHERE id=?;";

    auto st = PrepareOrNull(db, sql.c_str());
    if (!st) return std::nullopt;

    BindBlob(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadRecord(st.get());
}

Result SqliteRepository::DeleteRecord(Transaction& t, const model::RecordId& id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrNull(db, "DELETE FROM sync_record WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st.get(), 1, id);
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

std::vector<model::SyncRecord> SqliteRepository::ListChained(Transaction& t, uint8_t priority) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kRecordColumns +
                            " FROM sync_record WHERE priority=? AND sequence IS NOT NULL ORDER BY sequence;";
    auto st = PrepareOrNull(db, sql.c_str());
    if (!st) return {};

    BindI32(st.get(), 1, priority);
    return CollectRecords(st.get());
}

std::vector<model::SyncRecord> SqliteRepository::ListAllChained(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kRecordColumns +
                            " FROM sync_record WHERE sequence IS NOT NULL ORDER BY sequence;";
    auto st = PrepareOrNull(db, sql.c_str());
    if (!st) return {};

    return CollectRecords(st.get());
}

std::vector<model::SyncRecord> SqliteRepository::ListUnchained(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kRecordColumns +
                            " FROM sync_record WHERE sequence IS NULL ORDER BY row_id;";
    auto st = PrepareOrNull(db, sql.c_str());
    if (!st) return {};

    return CollectRecords(st.get());
}

std::vector<RecordSummary> SqliteRepository::ListEvictionCandidates(Transaction& t, uint8_t priority) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,priority,timestamp_ms,sequence,storage_bytes FROM sync_record "
        "WHERE priority=? AND sequence IS NOT NULL ORDER BY timestamp_ms, sequence;";
    auto st = PrepareOrNull(db, sql);
    if (!st) return {};

    BindI32(st.get(), 1, priority);
    return CollectSummaries(st.get());
}

std::vector<RecordSummary> SqliteRepository::ListExpired(Transaction& t, uint8_t priority, uint64_t cutoff_ms) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,priority,timestamp_ms,sequence,storage_bytes FROM sync_record "
        "WHERE priority=? AND sequence IS NOT NULL AND timestamp_ms<? ORDER BY timestamp_ms, sequence;";
    auto st = PrepareOrNull(db, sql);
    if (!st) return {};

    BindI32(st.get(), 1, priority);
    BindU64(st.get(), 2, cutoff_ms);
    return CollectSummaries(st.get());
}

uint64_t SqliteRepository::TotalStorageBytes(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrNull(db, "SELECT COALESCE(SUM(storage_bytes),0) FROM sync_record;");
    if (!st || sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return ColU64(st.get(), 0);
}

uint64_t SqliteRepository::CountRecords(Transaction& t, uint8_t priority) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrNull(db, "SELECT COUNT(*) FROM sync_record WHERE priority=?;");
    if (!st) return 0;

    BindI32(st.get(), 1, priority);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Chain head
// ------------------------------------------------------------------

std::optional<model::ChainState> SqliteRepository::LoadChainState(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrNull(db, "SELECT last_sequence,last_hash FROM chain_state WHERE id=1;");
    if (!st || sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    model::ChainState state;
    state.last_sequence = ColU64(st.get(), 0);
    state.last_hash     = ColArray<32>(st.get(), 1);
    return state;
}

Result SqliteRepository::SaveChainState(Transaction& t, const model::ChainState& s) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO chain_state(id,last_sequence,last_hash) VALUES(1,?,?) "
        "ON CONFLICT(id) DO UPDATE SET last_sequence=excluded.last_sequence, last_hash=excluded.last_hash;";

    auto st = PrepareOrNull(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, s.last_sequence);
    BindBlob(st.get(), 2, s.last_hash);

    return Translate(db, sqlite3_step(st.get()));
}

} // namespace edgesync::db::sqlite
