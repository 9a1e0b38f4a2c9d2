#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace lotcost::db::memory {

/*
  Transaction = snapshot + write set

  A kRead transaction only ever sees its snapshot; committing it publishes
  nothing and so cannot conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);
  ~MemoryTransaction();

  // Throws std::runtime_error if another transaction committed first.
  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return committed_ || rolled_back_;
  }

  // Throws std::logic_error in a kRead transaction.
  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  TxMode                  mode_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace lotcost::db::memory
