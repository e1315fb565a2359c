#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"

namespace stateshift::db::postgres {

class PgBackend;

/*
  Outermost scope pins a pooled connection and opens a pqxx::work on it;
  every backend call made while it is open runs on that work.
  Inner scopes reuse it.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(PgBackend& backend);
  ~PgTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  void AbortNative();
  void Finish();

  PgBackend&                             backend_;
  std::unique_lock<std::recursive_mutex> lock_;
  TransactionState                       saved_;
  std::shared_ptr<pqxx::connection>      conn_;
  std::unique_ptr<pqxx::work>            tx_;
  bool outermost_ = false;
  bool committed_ = false;
  bool finished_  = false;
};

}
