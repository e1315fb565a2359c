#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/backend_type.hpp"
#include "internal/db/api/document.hpp"
#include "internal/db/api/transaction.hpp"

namespace stateshift::db {

/*
  Backend abstraction.

  Uniform key -> document contract over heterogeneous storage engines.

  CRITICAL GUARANTEES:

  - Get() of a missing key is std::nullopt, never an error
  - ListKeys() is ordered by key (byte order)
  - Writes made inside an open transaction are fully reversed if the
    scope ends in Rollback() or an exception
  - ImportData() replaces the whole keyspace

  Errors are reported as util::StorageError.
*/

class Backend {
 public:
  virtual ~Backend() = default;

  virtual BackendType Type() const = 0;

  // ---------------------------------------------------------------------
  // Lifecycle
  // ---------------------------------------------------------------------

  virtual void Initialize()          = 0;
  virtual void Close()               = 0;
  virtual bool IsInitialized() const = 0;

  // ---------------------------------------------------------------------
  // Key-value
  // ---------------------------------------------------------------------

  virtual std::optional<Document> Get(const std::string& key)                      = 0;
  virtual void                    Set(const std::string& key, const Document& value) = 0;
  virtual bool                    Delete(const std::string& key)                   = 0;
  virtual bool                    Exists(const std::string& key)                   = 0;
  virtual std::vector<std::string> ListKeys(const std::string& prefix = "")        = 0;
  virtual void                    Clear()                                          = 0;

  // ---------------------------------------------------------------------
  // Bulk
  // ---------------------------------------------------------------------

  virtual DataMap ExportData()                   = 0;
  virtual void    ImportData(const DataMap& data) = 0;

  std::map<std::string, std::optional<Document>> BatchGet(const std::vector<std::string>& keys);
  void                                           BatchSet(const DataMap& items);
  std::map<std::string, bool>                    BatchDelete(const std::vector<std::string>& keys);

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin()               = 0;
  virtual bool                         InTransaction() const = 0;

  // ---------------------------------------------------------------------
  // Introspection
  // ---------------------------------------------------------------------

  // type, key_count, cache_size, cache_hit_rate, is_initialized + backend specifics
  virtual Document Stats() = 0;
};

/*
  Scoped unit of work: commits when `body` returns, rolls back and rethrows
  when it throws. A failed rollback is logged and never replaces the
  original exception.
*/
void RunInTransaction(Backend& backend, const std::function<void()>& body);

} // namespace stateshift::db
