#include "pg_pool.hpp"

namespace stateshift::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, int statement_timeout_ms)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      statement_timeout_ms_(statement_timeout_ms) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareConnection(*conn);
          return Wrap(conn.release());
        } catch (...) {
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
}

void PgPool::PrepareConnection(pqxx::connection& conn) const {
  if (statement_timeout_ms_ > 0) {
    pqxx::nontransaction session(conn);
    session.exec("SET statement_timeout = " + std::to_string(statement_timeout_ms_));
  }

  conn.prepare("get_value", "SELECT value::text FROM storage WHERE key=$1");

  conn.prepare("upsert_value",
               "INSERT INTO storage(key,value,created_at,updated_at) VALUES($1,$2::jsonb,NOW(),NOW()) "
               "ON CONFLICT(key) DO UPDATE SET value=EXCLUDED.value, updated_at=NOW()");

  conn.prepare("insert_value", "INSERT INTO storage(key,value,created_at,updated_at) VALUES($1,$2::jsonb,NOW(),NOW())");

  conn.prepare("delete_value", "DELETE FROM storage WHERE key=$1");

  conn.prepare("exists_value", "SELECT 1 FROM storage WHERE key=$1 LIMIT 1");

  conn.prepare("list_keys", "SELECT key FROM storage WHERE left(key, length($1))=$1 ORDER BY key COLLATE \"C\"");
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

} // namespace stateshift::db::postgres
