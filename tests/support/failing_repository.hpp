#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace lotcost::test {

enum class FailingWrite {
  kInsertLot,
  kUpdateLot,
  kInsertAdjustment,
  kInsertConsumption,
  kUpsertWeightedAverage,
  kInsertPurchase,
};

// Memory repository whose n-th call of one write operation returns an
// IOError ("disk full"). Every other call goes straight to the memory backend.
class FailingRepository final : public db::Repository {
 public:
  FailingRepository(std::shared_ptr<db::memory::MemoryRepository> inner, FailingWrite write, int fail_on_call = 1)
      : inner_(std::move(inner)), write_(write), fail_on_call_(fail_on_call) {
  }

  std::unique_ptr<db::Transaction> Begin(db::TxMode mode = db::TxMode::kReadWrite) override {
    return inner_->Begin(mode);
  }

  db::Result InsertItem(db::Transaction& t, const db::model::ItemRecord& r) override {
    return inner_->InsertItem(t, r);
  }
  std::optional<db::model::ItemRecord> GetItem(db::Transaction& t, const std::string& id) override {
    return inner_->GetItem(t, id);
  }
  std::vector<db::model::ItemRecord> ListItems(db::Transaction& t) override {
    return inner_->ListItems(t);
  }

  db::Result InsertLot(db::Transaction& t, db::model::LotRecord& r) override {
    if (Fails(FailingWrite::kInsertLot)) return DiskFull();
    return inner_->InsertLot(t, r);
  }
  std::optional<db::model::LotRecord> GetLot(db::Transaction& t, uint64_t id, db::RowLock lock) override {
    return inner_->GetLot(t, id, lock);
  }
  std::vector<db::model::LotRecord> ListLotsForItem(db::Transaction& t, const std::string& item_id,
                                                    const util::Decimal& min_remaining, db::RowLock lock) override {
    return inner_->ListLotsForItem(t, item_id, min_remaining, lock);
  }
  db::Result UpdateLot(db::Transaction& t, const db::model::LotRecord& r) override {
    if (Fails(FailingWrite::kUpdateLot)) return DiskFull();
    return inner_->UpdateLot(t, r);
  }

  db::Result InsertAdjustment(db::Transaction& t, const db::model::AdjustmentRecord& r) override {
    if (Fails(FailingWrite::kInsertAdjustment)) return DiskFull();
    return inner_->InsertAdjustment(t, r);
  }
  std::vector<db::model::AdjustmentRecord> ListAdjustments(db::Transaction& t, uint64_t id) override {
    return inner_->ListAdjustments(t, id);
  }

  db::Result InsertConsumption(db::Transaction& t, const db::model::ConsumptionRecord& r) override {
    if (Fails(FailingWrite::kInsertConsumption)) return DiskFull();
    return inner_->InsertConsumption(t, r);
  }
  std::vector<db::model::ConsumptionRecord> ListConsumptions(db::Transaction& t,
                                                             const std::string& context_id) override {
    return inner_->ListConsumptions(t, context_id);
  }

  std::optional<db::model::WeightedAverageRecord> GetWeightedAverage(db::Transaction& t, const std::string& item_id,
                                                                     db::RowLock lock) override {
    return inner_->GetWeightedAverage(t, item_id, lock);
  }
  db::Result UpsertWeightedAverage(db::Transaction& t, const db::model::WeightedAverageRecord& r) override {
    if (Fails(FailingWrite::kUpsertWeightedAverage)) return DiskFull();
    return inner_->UpsertWeightedAverage(t, r);
  }

  db::Result InsertPurchase(db::Transaction& t, db::model::PurchaseRecord& r) override {
    if (Fails(FailingWrite::kInsertPurchase)) return DiskFull();
    return inner_->InsertPurchase(t, r);
  }
  std::vector<db::model::PurchaseRecord> ListPurchases(db::Transaction& t, const std::string& item_id) override {
    return inner_->ListPurchases(t, item_id);
  }

 private:
  bool Fails(FailingWrite write) {
    return write == write_ && ++calls_ == fail_on_call_;
  }

  static db::Result DiskFull() {
    return db::Result::Err(db::ErrorCode::IOError, "disk full");
  }

  std::shared_ptr<db::memory::MemoryRepository> inner_;
  FailingWrite                                  write_;
  int                                           fail_on_call_;
  int                                           calls_ = 0;
};

} // namespace lotcost::test
