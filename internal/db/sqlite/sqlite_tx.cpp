#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "sqlite_backend.hpp"

namespace stateshift::db::sqlite {

using observability::StringField;

SqliteTransaction::SqliteTransaction(SqliteBackend& backend) : backend_(backend), lock_(backend.mutex_) {
  auto& db = backend_.Db();

  saved_     = backend_.tx_state_;
  outermost_ = !saved_.in_transaction;

  if (outermost_) {
    db.Exec("BEGIN IMMEDIATE;");
    backend_.tx_state_.rollback_only = false;
  }
  backend_.tx_state_.in_transaction = true;
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      Rollback();
    } catch (const std::exception& e) {
      STATESHIFT_LOG_WARN("SQLite rollback failed", {StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw util::DatabaseError("transaction already finished");
  }

  if (outermost_) {
    if (backend_.tx_state_.rollback_only) {
      RollbackNative();
      Finish();
      throw util::DatabaseError("transaction rolled back: an inner scope was rolled back");
    }

    try {
      backend_.Db().Exec("COMMIT;");
    } catch (...) {
      RollbackNative();
      Finish();
      throw;
    }
  }

  committed_ = true;
  Finish();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;

  if (!outermost_) {
    backend_.tx_state_.rollback_only = true;
    Finish();
    return;
  }

  std::exception_ptr error;
  try {
    backend_.Db().Exec("ROLLBACK;");
  } catch (...) {
    error = std::current_exception();
  }
  // cached rows may reflect uncommitted writes
  backend_.cache_.Clear();
  Finish();

  if (error) std::rethrow_exception(error);
}

void SqliteTransaction::RollbackNative() {
  try {
    backend_.Db().Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    STATESHIFT_LOG_WARN("SQLite rollback failed", {StringField("error", e.what())});
  }
  backend_.cache_.Clear();
}

void SqliteTransaction::Finish() {
  backend_.tx_state_.in_transaction = saved_.in_transaction;
  if (outermost_) {
    backend_.tx_state_.rollback_only = false;
  }
  finished_ = true;
  lock_.unlock();
}

} // namespace stateshift::db::sqlite
