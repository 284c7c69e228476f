#include "memory_tx.hpp"

namespace mediacache::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.tx_mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  repo_.committed_ = std::move(working_);
  finished_        = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  finished_ = true;
  lock_.unlock();
}

} // namespace mediacache::db::memory
