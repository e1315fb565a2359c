#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "json_backend.hpp"

namespace stateshift::db::json {

/*
  Transaction = deep-copy snapshot + live mutation.

  Holds the backend mutex for its whole lifetime, so other threads
  block rather than observe uncommitted writes.
*/
class JsonTransaction final : public db::Transaction {
 public:
  explicit JsonTransaction(JsonBackend& backend);
  ~JsonTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  void Finish();
  void RestoreSnapshot();

  JsonBackend&                           backend_;
  std::unique_lock<std::recursive_mutex> lock_;
  TransactionState                       saved_;
  bool                                   outermost_ = false;
  bool                                   committed_ = false;
  bool                                   finished_  = false;
};

} // namespace stateshift::db::json
