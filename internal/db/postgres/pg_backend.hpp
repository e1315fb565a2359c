#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/backend.hpp"
#include "internal/db/common/lru_cache.hpp"
#include "pg_pool.hpp"

namespace stateshift::db::postgres {

class PgTransaction;

struct PgBackendOptions {
  std::string conninfo;
  std::size_t pool_size       = 10;
  std::size_t cache_size      = 100;
  int         timeout_seconds = 30;
};

/*
  PostgreSQL document store: `storage` table with JSONB values.

  Calls made outside a transaction each run in their own short pqxx::work.
*/
class PgBackend final : public Backend {
 public:
  explicit PgBackend(PgBackendOptions options);
  ~PgBackend() override;

  BackendType Type() const override {
    return BackendType::kPostgresql;
  }

  void Initialize() override;
  void Close() override;
  bool IsInitialized() const override;

  std::optional<Document>  Get(const std::string& key) override;
  void                     Set(const std::string& key, const Document& value) override;
  bool                     Delete(const std::string& key) override;
  bool                     Exists(const std::string& key) override;
  std::vector<std::string> ListKeys(const std::string& prefix = "") override;
  void                     Clear() override;

  DataMap ExportData() override;
  void    ImportData(const DataMap& data) override;

  std::unique_ptr<Transaction> Begin() override;
  bool                         InTransaction() const override;

  Document Stats() override;

 private:
  friend class PgTransaction;

  PgPool& Pool() const;

  template <typename Fn>
  auto WithWork(Fn&& fn);

  void CreateTables();

  PgBackendOptions options_;

  mutable std::recursive_mutex            mutex_;
  std::shared_ptr<PgPool>                 pool_;
  pqxx::work*                             active_work_ = nullptr;
  TransactionState                        tx_state_;
  common::LruCache<std::string, Document> cache_;
};

} // namespace stateshift::db::postgres
