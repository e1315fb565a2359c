#include "history_store.hpp"

#include "internal/util/errors.hpp"

namespace stateshift::migration {

using util::MigrationError;
using util::StorageError;

namespace {

const std::string& RequireString(const db::Document& doc, const char* field) {
  const auto* value = db::Field(doc, field);
  if (!value || value->kind_case() != google::protobuf::Value::kStringValue) {
    throw StorageError(std::string("history record field '") + field + "' missing or not a string");
  }
  return value->string_value();
}

std::int64_t RequireInt(const db::Document& doc, const char* field) {
  const auto* value = db::Field(doc, field);
  if (!value) {
    throw StorageError(std::string("history record field '") + field + "' missing");
  }
  return db::AsInt(*value);
}

// Entries of `field` in the object stored under `key`; empty when absent.
std::vector<db::Document> ReadList(db::Backend& backend, const char* key, const char* field) {
  std::vector<db::Document> out;

  const auto stored = backend.Get(key);
  if (!stored) return out;

  const auto* list = db::Field(*stored, field);
  if (!list) return out;
  if (list->kind_case() != google::protobuf::Value::kListValue) {
    throw StorageError(std::string(key) + "." + field + " is not a list");
  }

  for (const auto& item : list->list_value().values()) {
    out.push_back(item);
  }
  return out;
}

} // namespace

db::Document ToDocument(const MigrationRecord& record) {
  auto doc = db::EmptyObject();
  *db::MutableField(doc, "version")     = db::IntValue(record.version);
  *db::MutableField(doc, "name")        = db::StringValue(record.name);
  *db::MutableField(doc, "description") = db::StringValue(record.description);

  auto deps = db::EmptyList();
  for (const auto dep : record.dependencies) {
    *deps.mutable_list_value()->add_values() = db::IntValue(dep);
  }
  *db::MutableField(doc, "dependencies") = std::move(deps);

  *db::MutableField(doc, "hash")       = db::StringValue(record.file_hash);
  *db::MutableField(doc, "applied_at") = db::StringValue(record.applied_at);
  return doc;
}

db::Document ToDocument(const RollbackRecord& record) {
  auto doc = db::EmptyObject();
  *db::MutableField(doc, "version")        = db::IntValue(record.version);
  *db::MutableField(doc, "name")           = db::StringValue(record.name);
  *db::MutableField(doc, "rolled_back_at") = db::StringValue(record.rolled_back_at);
  return doc;
}

MigrationRecord MigrationRecordFromDocument(const db::Document& doc) {
  MigrationRecord record;
  record.version = RequireInt(doc, "version");
  record.name    = RequireString(doc, "name");

  // Optional in records written by older tooling.
  if (const auto* description = db::Field(doc, "description")) {
    record.description = description->string_value();
  }
  if (const auto* deps = db::Field(doc, "dependencies")) {
    for (const auto& dep : deps->list_value().values()) {
      record.dependencies.insert(db::AsInt(dep));
    }
  }
  if (const auto* hash = db::Field(doc, "hash")) {
    record.file_hash = hash->string_value();
  }
  if (const auto* applied_at = db::Field(doc, "applied_at")) {
    record.applied_at = applied_at->string_value();
  }
  return record;
}

RollbackRecord RollbackRecordFromDocument(const db::Document& doc) {
  RollbackRecord record;
  record.version        = RequireInt(doc, "version");
  record.name           = RequireString(doc, "name");
  record.rolled_back_at = RequireString(doc, "rolled_back_at");
  return record;
}

std::int64_t HistoryStore::SchemaVersion() const {
  if (const auto stored = backend_.Get(kSchemaVersionKey)) {
    if (const auto* version = db::Field(*stored, "version")) {
      return db::AsInt(*version);
    }
  }

  const auto history = History();
  return history.empty() ? 0 : history.back().version;
}

std::vector<MigrationRecord> HistoryStore::History() const {
  std::vector<MigrationRecord> out;
  for (const auto& item : ReadList(backend_, kMigrationHistoryKey, "migrations")) {
    out.push_back(MigrationRecordFromDocument(item));
  }
  return out;
}

std::vector<RollbackRecord> HistoryStore::RollbackHistory() const {
  std::vector<RollbackRecord> out;
  for (const auto& item : ReadList(backend_, kRollbackHistoryKey, "rollbacks")) {
    out.push_back(RollbackRecordFromDocument(item));
  }
  return out;
}

void HistoryStore::RecordApplied(const MigrationRecord& record) {
  RequireTransaction("record migration");

  auto history = History();
  if (!history.empty() && history.back().version >= record.version) {
    throw MigrationError(record.version, record.name,
                         "Migration " + record.name + " is not newer than the last applied version " + std::to_string(history.back().version));
  }

  history.push_back(record);
  WriteHistory(history);
  WriteSchemaVersion(record.version);
}

MigrationRecord HistoryStore::RemoveApplied(std::int64_t version, const std::string& rolled_back_at) {
  RequireTransaction("remove migration");

  auto history = History();
  if (history.empty() || history.back().version != version) {
    throw MigrationError(version, "", "Version " + std::to_string(version) + " is not the newest applied migration");
  }

  auto removed = history.back();
  history.pop_back();
  WriteHistory(history);
  WriteSchemaVersion(history.empty() ? 0 : history.back().version);

  auto rollbacks = RollbackHistory();
  rollbacks.push_back(RollbackRecord{removed.version, removed.name, rolled_back_at});

  auto list = db::EmptyList();
  for (const auto& item : rollbacks) {
    *list.mutable_list_value()->add_values() = ToDocument(item);
  }
  auto doc = db::EmptyObject();
  *db::MutableField(doc, "rollbacks") = std::move(list);
  backend_.Set(kRollbackHistoryKey, doc);

  return removed;
}

void HistoryStore::RequireTransaction(const char* operation) const {
  if (!backend_.InTransaction()) {
    throw MigrationError(std::string("cannot ") + operation + " outside a transaction");
  }
}

void HistoryStore::WriteHistory(const std::vector<MigrationRecord>& records) {
  auto list = db::EmptyList();
  for (const auto& record : records) {
    *list.mutable_list_value()->add_values() = ToDocument(record);
  }
  auto doc = db::EmptyObject();
  *db::MutableField(doc, "migrations") = std::move(list);
  backend_.Set(kMigrationHistoryKey, doc);
}

void HistoryStore::WriteSchemaVersion(std::int64_t version) {
  auto doc = db::EmptyObject();
  *db::MutableField(doc, "version") = db::IntValue(version);
  backend_.Set(kSchemaVersionKey, doc);
}

} // namespace stateshift::migration
