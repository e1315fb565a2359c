#include "pg_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "pg_backend.hpp"

namespace stateshift::db::postgres {

using observability::StringField;

PgTransaction::PgTransaction(PgBackend& backend) : backend_(backend), lock_(backend.mutex_) {
  saved_     = backend_.tx_state_;
  outermost_ = !saved_.in_transaction;

  if (outermost_) {
    try {
      conn_ = backend_.Pool().Acquire();
      tx_   = std::make_unique<pqxx::work>(*conn_);
    } catch (const pqxx::failure& e) {
      throw util::StorageError("postgres begin failed: " + std::string(e.what()));
    }
    backend_.active_work_            = tx_.get();
    backend_.tx_state_.rollback_only = false;
  }
  backend_.tx_state_.in_transaction = true;
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      Rollback();
    } catch (const std::exception& e) {
      STATESHIFT_LOG_WARN("Postgres rollback failed", {StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  if (finished_) {
    throw util::DatabaseError("transaction already finished");
  }

  if (outermost_) {
    if (backend_.tx_state_.rollback_only) {
      AbortNative();
      Finish();
      throw util::DatabaseError("transaction rolled back: an inner scope was rolled back");
    }

    try {
      tx_->commit();
    } catch (const pqxx::failure& e) {
      AbortNative();
      Finish();
      throw util::StorageError("postgres commit failed: " + std::string(e.what()));
    }
  }

  committed_ = true;
  Finish();
}

void PgTransaction::Rollback() {
  if (finished_) return;

  if (!outermost_) {
    backend_.tx_state_.rollback_only = true;
    Finish();
    return;
  }

  std::exception_ptr error;
  try {
    tx_->abort();
  } catch (...) {
    error = std::current_exception();
  }
  backend_.cache_.Clear();
  Finish();

  if (error) std::rethrow_exception(error);
}

void PgTransaction::AbortNative() {
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    STATESHIFT_LOG_WARN("Postgres rollback failed", {StringField("error", e.what())});
  }
  backend_.cache_.Clear();
}

void PgTransaction::Finish() {
  backend_.tx_state_.in_transaction = saved_.in_transaction;
  if (outermost_) {
    backend_.tx_state_.rollback_only = false;
    backend_.active_work_            = nullptr;
    tx_.reset();
    conn_.reset();
  }
  finished_ = true;
  lock_.unlock();
}

}
