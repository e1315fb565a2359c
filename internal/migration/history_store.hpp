#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/backend.hpp"

namespace stateshift::migration {

struct MigrationRecord {
  std::int64_t           version = 0;
  std::string            name;
  std::string            description;
  std::set<std::int64_t> dependencies;
  std::string            file_hash;
  std::string            applied_at; // ISO-8601
};

struct RollbackRecord {
  std::int64_t version = 0;
  std::string  name;
  std::string  rolled_back_at; // ISO-8601
};

/*
  HistoryStore

  Migration bookkeeping persisted through the backend itself:

    _schema_version     {"version": N}
    _migration_history  {"migrations": [record, ...]}  ascending by version
    _rollback_history   {"rollbacks":  [record, ...]}  in rollback order

  SchemaVersion and History are only ever written together, and only inside
  an open backend transaction.
*/
class HistoryStore {
 public:
  static constexpr const char* kSchemaVersionKey   = "_schema_version";
  static constexpr const char* kMigrationHistoryKey = "_migration_history";
  static constexpr const char* kRollbackHistoryKey  = "_rollback_history";

  explicit HistoryStore(db::Backend& backend) : backend_(backend) {
  }

  // 0 for an empty store. Falls back to the newest history entry when the
  // version key is absent.
  std::int64_t SchemaVersion() const;

  std::vector<MigrationRecord> History() const;
  std::vector<RollbackRecord>  RollbackHistory() const;

  // Appends `record` and sets SchemaVersion to its version.
  // Throws util::MigrationError outside a transaction or when `record` is
  // not newer than the last entry.
  void RecordApplied(const MigrationRecord& record);

  // Removes the newest entry (which must be `version`), appends a rollback
  // record and resets SchemaVersion to the newest remaining entry or 0.
  MigrationRecord RemoveApplied(std::int64_t version, const std::string& rolled_back_at);

 private:
  void RequireTransaction(const char* operation) const;
  void WriteHistory(const std::vector<MigrationRecord>& records);
  void WriteSchemaVersion(std::int64_t version);

  db::Backend& backend_;
};

db::Document ToDocument(const MigrationRecord& record);
db::Document ToDocument(const RollbackRecord& record);

MigrationRecord MigrationRecordFromDocument(const db::Document& doc);
RollbackRecord  RollbackRecordFromDocument(const db::Document& doc);

} // namespace stateshift::migration
