#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace ledgersync::db::sqlite {

/*
  BEGIN IMMEDIATE transaction holding the connection's writer mutex until
  it finishes. A failed COMMIT is rolled back before the error propagates.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return state_ == State::kCommitted; }

private:
  enum class State : std::uint8_t { kOpen, kCommitted, kRolledBack };

  void Finish(State state);

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> writer_lock_;
  State                        state_ = State::kOpen;
};

}
