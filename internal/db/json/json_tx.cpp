#include "json_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stateshift::db::json {

JsonTransaction::JsonTransaction(JsonBackend& backend) : backend_(backend), lock_(backend.mutex_) {
  backend_.RequireInitialized();

  saved_     = backend_.tx_state_;
  outermost_ = !saved_.in_transaction;

  if (outermost_) {
    backend_.snapshot_               = backend_.data_; // deep copy
    backend_.tx_state_.rollback_only = false;
  }
  backend_.tx_state_.in_transaction = true;
}

JsonTransaction::~JsonTransaction() {
  if (!finished_) {
    try {
      Rollback();
    } catch (const std::exception& e) {
      STATESHIFT_LOG_WARN("Json transaction rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void JsonTransaction::Commit() {
  if (finished_) {
    throw util::DatabaseError("transaction already finished");
  }

  if (outermost_) {
    if (backend_.tx_state_.rollback_only) {
      RestoreSnapshot();
      Finish();
      throw util::DatabaseError("transaction rolled back: an inner scope was rolled back");
    }

    if (backend_.options_.auto_save) {
      try {
        backend_.WriteFile();
      } catch (...) {
        // Memory goes back to the pre-transaction state; the file was never replaced.
        RestoreSnapshot();
        Finish();
        throw;
      }
    }
    backend_.snapshot_.clear();
  }

  committed_ = true;
  Finish();
}

void JsonTransaction::Rollback() {
  if (finished_) return;

  if (outermost_) {
    RestoreSnapshot();
    STATESHIFT_LOG_DEBUG("Json transaction rolled back", {observability::StringField("path", backend_.options_.path.string())});
  } else {
    backend_.tx_state_.rollback_only = true;
  }
  Finish();
}

void JsonTransaction::RestoreSnapshot() {
  backend_.data_ = std::move(backend_.snapshot_);
  backend_.snapshot_.clear();
  backend_.cache_.Clear();
}

void JsonTransaction::Finish() {
  backend_.tx_state_.in_transaction = saved_.in_transaction;
  if (outermost_) {
    backend_.tx_state_.rollback_only = false;
  }
  finished_ = true;
  lock_.unlock();
}

} // namespace stateshift::db::json
