#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>

#include "internal/db/api/backend.hpp"
#include "internal/db/common/lru_cache.hpp"
#include "sqlite_db.hpp"

namespace stateshift::db::sqlite {

class SqliteTransaction;

struct SqliteBackendOptions {
  std::filesystem::path path;
  std::size_t           cache_size      = 100;
  int                   timeout_seconds = 30;
};

/*
  SQLite document store.

  One `storage` table (key TEXT PRIMARY KEY, value TEXT JSON). Outside a
  transaction every statement autocommits; inside one the connection is
  in manual-commit mode until the outermost scope ends.
*/
class SqliteBackend final : public Backend {
 public:
  explicit SqliteBackend(SqliteBackendOptions options);
  ~SqliteBackend() override;

  BackendType Type() const override {
    return BackendType::kSqlite;
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
  friend class SqliteTransaction;

  SqliteDB& Db() const;
  void      CreateTables();
  void      Insert(const std::string& key, const Document& value);

  SqliteBackendOptions options_;

  mutable std::recursive_mutex            mutex_;
  std::unique_ptr<SqliteDB>               db_;
  TransactionState                        tx_state_;
  common::LruCache<std::string, Document> cache_;
};

} // namespace stateshift::db::sqlite
