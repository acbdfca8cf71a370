#include "sqlite_tx.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace ledgersync::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_lock_(db_->WriterMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    LEDGERSYNC_LOG_ERROR("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Finish(State state) {
  state_ = state;
  writer_lock_.unlock();
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) {
    throw std::runtime_error("sqlite commit: transaction already finished");
  }

  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    LEDGERSYNC_LOG_WARN("sqlite commit failed; rolling back", {observability::StringField("error", e.what())});
    Rollback();
    throw;
  }
  Finish(State::kCommitted);
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) return;
  db_->Exec("ROLLBACK;");
  Finish(State::kRolledBack);
}

} // namespace ledgersync::db::sqlite
