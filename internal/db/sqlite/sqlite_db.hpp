#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace ledgersync::db::sqlite {

/*
  Owns the local ledger database connection.

  One connection is shared by all transactions; WriterMutex() serializes
  them so BEGIN/COMMIT pairs never interleave. ":memory:" opens a private
  in-memory database (no WAL).
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool InMemory() const {
    return path_ == ":memory:";
  }

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  // Execute a SQL string (pragmas, schema)
  void Exec(const std::string& sql);

  // PRAGMA user_version; the schema revision stamped by BootstrapSchema.
  int  UserVersion();
  void SetUserVersion(int version);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

} // namespace ledgersync::db::sqlite
