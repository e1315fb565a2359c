#include "internal/migration/history_store.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/db/json/json_backend.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using stateshift::db::RunInTransaction;
using stateshift::db::json::JsonBackend;
using stateshift::db::json::JsonBackendOptions;
using stateshift::migration::HistoryStore;
using stateshift::migration::MigrationRecord;
using stateshift::util::MigrationError;

constexpr std::int64_t kV1 = 202501010000;
constexpr std::int64_t kV2 = 202501020000;

JsonBackendOptions Options(const std::string& test_name) {
  const auto dir = fs::temp_directory_path() / "stateshift_history_store_tests" / test_name;
  fs::remove_all(dir);

  JsonBackendOptions options;
  options.path = dir / "store.json";
  return options;
}

MigrationRecord Record(std::int64_t version, const std::string& name) {
  MigrationRecord record;
  record.version    = version;
  record.name       = name;
  record.file_hash  = "hash-" + name;
  record.applied_at = "2025-01-01T00:00:00Z";
  return record;
}

void TestEmptyStoreIsVersionZero() {
  JsonBackend backend(Options("empty"));
  backend.Initialize();

  HistoryStore store(backend);
  assert(store.SchemaVersion() == 0);
  assert(store.History().empty());
  assert(store.RollbackHistory().empty());
}

void TestWritesAreRefusedOutsideTransaction() {
  JsonBackend backend(Options("no_tx"));
  backend.Initialize();

  HistoryStore store(backend);
  bool         threw = false;
  try {
    store.RecordApplied(Record(kV1, "init"));
  } catch (const MigrationError&) {
    threw = true;
  }
  assert(threw);
  assert(backend.ListKeys().empty());
}

void TestRecordAppliedUpdatesVersionAndHistoryTogether() {
  JsonBackend backend(Options("record"));
  backend.Initialize();
  HistoryStore store(backend);

  auto v2         = Record(kV2, "settings");
  v2.dependencies = {kV1};
  v2.description  = "Adds settings";

  RunInTransaction(backend, [&] { store.RecordApplied(Record(kV1, "init")); });
  RunInTransaction(backend, [&] { store.RecordApplied(v2); });

  assert(store.SchemaVersion() == kV2);

  const auto history = store.History();
  assert(history.size() == 2);
  assert(history[0].version == kV1 && history[0].file_hash == "hash-init");
  assert(history[1].version == kV2);
  assert(history[1].dependencies == std::set<std::int64_t>{kV1});
  assert(history[1].description == "Adds settings");

  // Stored under the reserved keys.
  const auto version_doc = backend.Get(HistoryStore::kSchemaVersionKey);
  assert(stateshift::db::AsInt(*stateshift::db::Field(*version_doc, "version")) == kV2);
  const auto history_doc = backend.Get(HistoryStore::kMigrationHistoryKey);
  assert(stateshift::db::Field(*history_doc, "migrations")->list_value().values_size() == 2);
}

void TestOutOfOrderRecordIsRejected() {
  JsonBackend backend(Options("out_of_order"));
  backend.Initialize();
  HistoryStore store(backend);

  RunInTransaction(backend, [&] { store.RecordApplied(Record(kV2, "later")); });

  bool threw = false;
  try {
    RunInTransaction(backend, [&] { store.RecordApplied(Record(kV1, "earlier")); });
  } catch (const MigrationError& e) {
    threw = e.version() == kV1;
  }
  assert(threw);
  assert(store.History().size() == 1);
  assert(store.SchemaVersion() == kV2);
}

void TestRemoveAppliedRewindsVersionAndLogsRollback() {
  JsonBackend backend(Options("remove"));
  backend.Initialize();
  HistoryStore store(backend);

  RunInTransaction(backend, [&] {
    store.RecordApplied(Record(kV1, "init"));
    store.RecordApplied(Record(kV2, "settings"));
  });

  bool threw = false;
  try {
    RunInTransaction(backend, [&] { store.RemoveApplied(kV1, "2025-01-03T00:00:00Z"); });
  } catch (const MigrationError&) {
    threw = true;
  }
  assert(threw);

  RunInTransaction(backend, [&] {
    const auto removed = store.RemoveApplied(kV2, "2025-01-03T00:00:00Z");
    assert(removed.name == "settings");
  });
  assert(store.SchemaVersion() == kV1);

  RunInTransaction(backend, [&] { store.RemoveApplied(kV1, "2025-01-04T00:00:00Z"); });
  assert(store.SchemaVersion() == 0);
  assert(store.History().empty());

  const auto rollbacks = store.RollbackHistory();
  assert(rollbacks.size() == 2);
  assert(rollbacks[0].version == kV2 && rollbacks[0].rolled_back_at == "2025-01-03T00:00:00Z");
  assert(rollbacks[1].version == kV1);
}

void TestVersionFallsBackToNewestHistoryEntry() {
  JsonBackend backend(Options("fallback"));
  backend.Initialize();
  HistoryStore store(backend);

  RunInTransaction(backend, [&] {
    store.RecordApplied(Record(kV1, "init"));
    store.RecordApplied(Record(kV2, "settings"));
  });
  backend.Delete(HistoryStore::kSchemaVersionKey);

  assert(store.SchemaVersion() == kV2);
}

} // namespace

int main() {
  TestEmptyStoreIsVersionZero();
  TestWritesAreRefusedOutsideTransaction();
  TestRecordAppliedUpdatesVersionAndHistoryTogether();
  TestOutOfOrderRecordIsRejected();
  TestRemoveAppliedRewindsVersionAndLogsRollback();
  TestVersionFallsBackToNewestHistoryEntry();

  std::cout << "stateshift_unit_history_store: pass\n";
  return 0;
}
