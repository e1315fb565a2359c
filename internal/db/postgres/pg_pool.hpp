#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace stateshift::db::postgres {

/*
  PgPool

  Connection pool used by PgBackend.

  Design notes:
  -------------
  - A transaction pins one connection for its whole lifetime.
  - libpqxx connections are NOT thread-safe → do not share.
  - Prepared statements and statement_timeout are installed per connection.
  - Acquire() blocks once max_connections are live.

  Lifetime:
    Backend owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections, int statement_timeout_ms);

  // Acquire a ready-to-use connection; returned to the pool when released.
  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t MaxConnections() const {
    return max_connections_;
  }

 private:
  void                              PrepareConnection(pqxx::connection& conn) const;
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;
  int         statement_timeout_ms_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace stateshift::db::postgres
