#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::db::sqlite {

SqliteDB::SqliteDB(std::string path) : SqliteDB(std::move(path), Options{}) {
}

SqliteDB::SqliteDB(std::string path, Options options) : path_(std::move(path)), options_(options) {
  if (path_.empty()) {
    throw std::invalid_argument("sqlite outbox path is empty");
  }
  Open();
  ApplyPragmas();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Open() {
  const std::filesystem::path file(path_);
  if (file.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("cannot create outbox directory " + file.parent_path().string() + ": " + ec.message());
    }
  }

  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open outbox " + path_ + ": " + msg);
  }

  EDGESYNC_LOG_INFO("outbox opened", {observability::StringField("path", path_)});
}

void SqliteDB::Fail(int rc, const std::string& what) const {
  const std::string msg = what + ": " + sqlite3_errmsg(db_);
  if (rc == SQLITE_FULL) throw util::StorageFull(msg);
  throw std::runtime_error(msg);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    if (rc == SQLITE_FULL) throw util::StorageFull(msg);
    throw std::runtime_error("sqlite exec: " + msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  const int     rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) Fail(rc, "sqlite prepare");
  return stmt;
}

void SqliteDB::ApplyPragmas() {
  Exec("PRAGMA journal_mode=WAL;");
  Exec(options_.synchronous_full ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");

  const int rc = sqlite3_busy_timeout(db_, options_.busy_timeout_ms);
  if (rc != SQLITE_OK) Fail(rc, "sqlite busy_timeout");

  if (!options_.synchronous_full) {
    EDGESYNC_LOG_WARN("outbox uses synchronous=NORMAL; last commits may be lost on power failure", {observability::StringField("path", path_)});
  }
}

} // namespace edgesync::db::sqlite
