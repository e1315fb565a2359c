#pragma once

namespace stateshift::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Rollback() discards all writes made since the outermost Begin()
  - Commit() makes them durable
  - Destructor MUST rollback if neither Commit() nor Rollback() ran
  - Nested Begin() reuses the outermost boundary; an inner Rollback()
    marks the outer transaction rollback-only

  SQLite:   BEGIN IMMEDIATE
  Postgres: pqxx::work on a pinned pooled connection
  Json:     deep-copy snapshot, swapped back on rollback
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

/*
  Per-backend nesting state, saved and restored by each scope.
*/
struct TransactionState {
  bool in_transaction = false;
  bool rollback_only  = false;
};

}
