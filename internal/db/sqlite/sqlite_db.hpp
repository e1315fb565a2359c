#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace stateshift::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, int busy_timeout_ms);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/DDL/transaction control)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(int busy_timeout_ms);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement, finalized on destruction.
  All failures surface as util::StorageError.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& value);
  void BindInt64(int idx, std::int64_t value);

  // true when a row is available, false when done
  bool Step();

  std::string  ColumnText(int col) const;
  std::int64_t ColumnInt64(int col) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace stateshift::db::sqlite
