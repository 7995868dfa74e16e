#include "pg_pool.hpp"

namespace omni::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("omni_get_asset_by_symbol",
               "SELECT id,symbol,name,slug,first_seen_ms,last_seen_ms,status FROM cryptocurrency WHERE symbol=$1");

  conn.prepare("omni_insert_observation",
               "INSERT INTO crypto_market_data(crypto_id,timestamp_ms,price_usd,market_cap_usd,volume_24h_usd,percent_change_1h,"
               "percent_change_24h,percent_change_7d,circulating_supply,total_supply,max_supply) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");

  conn.prepare("omni_latest_signal",
               "SELECT crypto_id,timestamp_ms,daily_return,ma_7d,std_7d,rsi,signal FROM crypto_signals WHERE crypto_id=$1 "
               "ORDER BY timestamp_ms DESC LIMIT 1");
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
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace omni::db::postgres
