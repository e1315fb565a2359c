#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"

namespace stateshift::db::sqlite {

class SqliteBackend;

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Nested scopes save/restore the backend's in-transaction flag and
  never issue their own BEGIN/COMMIT.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(SqliteBackend& backend);
  ~SqliteTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  void RollbackNative();
  void Finish();

  SqliteBackend&                         backend_;
  std::unique_lock<std::recursive_mutex> lock_;
  TransactionState                       saved_;
  bool outermost_ = false;
  bool committed_ = false;
  bool finished_  = false;
};

}
