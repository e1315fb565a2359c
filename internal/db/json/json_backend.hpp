#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>

#include "internal/db/api/backend.hpp"
#include "internal/db/common/lru_cache.hpp"

namespace stateshift::db::json {

class JsonTransaction;

struct JsonBackendOptions {
  std::filesystem::path path;
  std::size_t           cache_size        = 100;
  bool                  auto_save         = true;
  std::size_t           file_backup_count = 3;
};

/*
  File-backed document store.

  The whole keyspace lives in memory and is serialized to one JSON file.
  There is no native atomic primitive, so transactions are emulated:

    Begin     deep-copy the live map into a holding buffer (mutex held)
    writes    mutate the live map directly, file untouched
    Commit    drop the buffer, persist if auto_save
    Rollback  swap the buffer back, drop the read cache

  This is single-process atomicity only and costs O(store size) per
  transaction. It is not equivalent to the SQL backends' guarantees.
*/
class JsonBackend final : public Backend {
 public:
  explicit JsonBackend(JsonBackendOptions options);
  ~JsonBackend() override;

  JsonBackend(const JsonBackend&)            = delete;
  JsonBackend& operator=(const JsonBackend&) = delete;

  BackendType Type() const override {
    return BackendType::kJson;
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

  const std::filesystem::path& Path() const {
    return options_.path;
  }

  // Write the live map to disk now (temp file + rename, with .bakN rotation).
  void Save();

 private:
  friend class JsonTransaction;

  void RequireInitialized() const;
  void PersistIfAutoSave();
  void WriteFile();
  void RotateBackups();

  JsonBackendOptions options_;

  mutable std::recursive_mutex            mutex_;
  DataMap                                 data_;
  DataMap                                 snapshot_;
  TransactionState                        tx_state_;
  common::LruCache<std::string, Document> cache_;
  bool                                    initialized_ = false;
};

} // namespace stateshift::db::json
