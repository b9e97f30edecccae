#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace edgesync::db::sqlite {

/*
  Owns the single outbox connection.

  Opening creates the parent directory and applies the durability pragmas;
  a failure to open or configure throws, since a node without its outbox
  must not start.
*/
class SqliteDB {
 public:
  struct Options {
    // FULL fsyncs the WAL on every commit; a committed record survives power loss.
    bool synchronous_full = true;
    int  busy_timeout_ms  = 5000;
  };

  explicit SqliteDB(std::string path);
  SqliteDB(std::string path, Options options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  void Exec(const std::string& sql);

  // caller finalizes
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Open();
  void ApplyPragmas();
  [[noreturn]] void Fail(int rc, const std::string& what) const;

  sqlite3*    db_ = nullptr;
  std::string path_;
  Options     options_;
};

} // namespace edgesync::db::sqlite
