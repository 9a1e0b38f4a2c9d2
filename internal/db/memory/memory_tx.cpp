#include "memory_tx.hpp"

#include <stdexcept>

namespace lotcost::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (IsFinished()) {
    throw std::logic_error("transaction already finished");
  }
  if (mode_ == TxMode::kRead) {
    committed_ = true;
    return;
  }
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    rolled_back_ = true;
    throw std::runtime_error("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (mode_ == TxMode::kRead) {
    throw std::logic_error("write in a read-only transaction");
  }
  return working_;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace lotcost::db::memory
