#include "pg_pool.hpp"

namespace lotcost::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) {
        return Wrap(conn.release());
      }
      // Dropped by the server; forget it and open a fresh one below.
      --live_connections_;
      continue;
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  constexpr const char* kLotColumns =
      "id, item_id, acquisition_date::text, quantity_original::text, quantity_remaining::text, unit_cost::text, "
      "expiration_date::text, location, notes";

  conn.prepare("get_lot", std::string("SELECT ") + kLotColumns + " FROM lots WHERE id=$1");

  conn.prepare("get_lot_for_update", std::string("SELECT ") + kLotColumns + " FROM lots WHERE id=$1 FOR UPDATE");

  conn.prepare("lots_for_item",
               std::string("SELECT ") + kLotColumns +
                   " FROM lots WHERE item_id=$1 AND quantity_remaining >= $2::numeric"
                   " ORDER BY acquisition_date ASC, id ASC");

  conn.prepare("lots_for_item_for_update",
               std::string("SELECT ") + kLotColumns +
                   " FROM lots WHERE item_id=$1 AND quantity_remaining >= $2::numeric"
                   " ORDER BY acquisition_date ASC, id ASC FOR UPDATE");

  conn.prepare("update_lot",
               "UPDATE lots SET quantity_remaining=$2::numeric, unit_cost=$3::numeric, expiration_date=$4::date, "
               "location=$5, notes=$6 WHERE id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace lotcost::db::postgres
