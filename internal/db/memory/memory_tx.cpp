#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace ledgersync::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_lock_(repo.writer_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("transaction already finished");
  }
  std::scoped_lock lock(repo_.mutex_);
  repo_.committed_ = std::move(working_);
  committed_       = true;
  writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;
  working_     = {};
  rolled_back_ = true;
  writer_lock_.unlock();
}

} // namespace ledgersync::db::memory
