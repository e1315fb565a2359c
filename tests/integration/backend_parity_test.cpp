#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/backup/backup_manager.hpp"
#include "internal/db/api/backend.hpp"
#include "internal/db/json/json_backend.hpp"
#include "internal/migration/migration_runner.hpp"
#include "internal/util/errors.hpp"

#if STATESHIFT_DB_SQLITE
#include "internal/db/sqlite/sqlite_backend.hpp"
#endif

#if STATESHIFT_DB_POSTGRES
#include "internal/db/postgres/pg_backend.hpp"
#endif

namespace {

namespace fs = std::filesystem;

using stateshift::db::Backend;
using stateshift::db::DataMap;
using stateshift::db::Equals;
using stateshift::db::Field;
using stateshift::db::IntValue;
using stateshift::db::RunInTransaction;
using stateshift::db::StringValue;
using stateshift::migration::HistoryStore;
using stateshift::migration::MigrationDefinition;
using stateshift::migration::MigrationRegistry;
using stateshift::migration::MigrationRunner;
using stateshift::migration::RuntimeConfig;
using stateshift::util::DatabaseError;
using stateshift::util::MigrationError;

constexpr std::int64_t kV1 = 202501010000;
constexpr std::int64_t kV2 = 202501020000;

struct BackendFactory {
  std::string                               name;
  std::function<std::unique_ptr<Backend>()> make_backend;
  std::function<void()>                     cleanup;
};

fs::path ScratchDir(const std::string& name) {
  return fs::temp_directory_path() / "stateshift_backend_parity" / name;
}

void VerifyKeyValueContract(Backend& backend) {
  assert(!backend.Get("missing").has_value());
  assert(!backend.Exists("missing"));
  assert(!backend.Delete("missing"));

  auto doc = stateshift::db::EmptyObject();
  *stateshift::db::MutableField(doc, "name")  = StringValue("ada");
  *stateshift::db::MutableField(doc, "count") = IntValue(3);
  backend.Set("user:2", doc);
  backend.Set("user:1", StringValue("first"));
  backend.Set("config", IntValue(42));

  const auto read = backend.Get("user:2");
  assert(read.has_value());
  assert(Equals(*read, doc));

  backend.Set("config", IntValue(43));
  assert(stateshift::db::AsInt(*backend.Get("config")) == 43);

  const auto users = backend.ListKeys("user:");
  assert((users == std::vector<std::string>{"user:1", "user:2"}));
  assert(backend.ListKeys().size() == 3);

  assert(backend.Delete("user:1"));
  assert(!backend.Exists("user:1"));

  const auto batch = backend.BatchGet({"user:2", "absent"});
  assert(batch.at("user:2").has_value());
  assert(!batch.at("absent").has_value());

  backend.Clear();
  assert(backend.ListKeys().empty());
}

void VerifyRollbackIsExact(Backend& backend) {
  backend.Set("keep", IntValue(1));
  backend.Set("change", StringValue("before"));
  const auto before = backend.ExportData();

  {
    auto tx = backend.Begin();
    backend.Set("change", StringValue("after"));
    backend.Delete("keep");
    backend.Set("added", IntValue(7));
    assert(backend.InTransaction());
    tx->Rollback();
  }
  assert(!backend.InTransaction());
  assert(Equals(backend.ExportData(), before));

  bool threw = false;
  try {
    RunInTransaction(backend, [&] {
      backend.Set("added", IntValue(8));
      throw std::runtime_error("abort");
    });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(Equals(backend.ExportData(), before));

  // Abandoned scope rolls back.
  {
    auto tx = backend.Begin();
    backend.Set("abandoned", IntValue(1));
  }
  assert(!backend.Exists("abandoned"));

  backend.Clear();
}

void VerifyNestedScopes(Backend& backend) {
  {
    auto outer = backend.Begin();
    backend.Set("outer", IntValue(1));
    {
      auto inner = backend.Begin();
      backend.Set("inner", IntValue(2));
      inner->Commit();
    }
    outer->Commit();
  }
  assert(backend.Exists("outer"));
  assert(backend.Exists("inner"));

  const auto before = backend.ExportData();
  bool       threw  = false;
  {
    auto outer = backend.Begin();
    backend.Set("outer", IntValue(10));
    {
      auto inner = backend.Begin();
      backend.Set("inner", IntValue(20));
      inner->Rollback();
    }
    try {
      outer->Commit();
    } catch (const DatabaseError&) {
      threw = true;
    }
  }
  assert(threw);
  assert(Equals(backend.ExportData(), before));

  backend.Clear();
}

void VerifyImportReplacesKeyspace(Backend& backend) {
  backend.Set("stale", IntValue(1));

  DataMap incoming;
  incoming["a"] = IntValue(1);
  incoming["b"] = StringValue("two");
  backend.ImportData(incoming);

  assert(Equals(backend.ExportData(), incoming));
  assert(!backend.Exists("stale"));

  backend.Clear();
}

void VerifyMigrationScenario(Backend& backend, bool fail_second) {
  backend.Clear();

  MigrationRegistry registry;

  MigrationDefinition v1;
  v1.metadata = {kV1, "v1", "", {}, false, false};
  v1.apply    = [](Backend& b, const RuntimeConfig&) { b.Set("v1", IntValue(1)); };
  registry.Register(std::move(v1));

  MigrationDefinition v2;
  v2.metadata = {kV2, "v2", "", {kV1}, false, false};
  v2.apply    = [fail_second](Backend& b, const RuntimeConfig&) {
    b.Set("v2", IntValue(2));
    if (fail_second) throw std::runtime_error("v2 failed");
  };
  registry.Register(std::move(v2));

  MigrationRunner runner(backend, registry, RuntimeConfig{});
  bool            threw = false;
  try {
    runner.Run();
  } catch (const MigrationError& e) {
    threw = e.version() == kV2;
  }
  assert(threw == fail_second);

  HistoryStore history(backend);
  if (fail_second) {
    assert(history.SchemaVersion() == kV1);
    assert(history.History().size() == 1);
    assert(!backend.Exists("v2"));
  } else {
    assert(history.SchemaVersion() == kV2);
    assert(history.History().size() == 2);
  }

  backend.Clear();
}

void VerifyRestartDurability(BackendFactory& factory) {
  {
    auto backend = factory.make_backend();
    backend->Set("durable", StringValue("yes"));
    RunInTransaction(*backend, [&] { backend->Set("durable_tx", IntValue(1)); });
    backend->Close();
  }

  auto backend = factory.make_backend();
  assert(backend->Get("durable")->string_value() == "yes");
  assert(backend->Exists("durable_tx"));

  const auto stats = backend->Stats();
  assert(Field(stats, "type")->string_value() == factory.name);
  assert(stateshift::db::AsInt(*Field(stats, "key_count")) == 2);

  backend->Clear();
  backend->Close();
}

void VerifyBackupMovesAcrossBackends(BackendFactory& from, BackendFactory& to) {
  auto source = from.make_backend();
  source->Set("shared", StringValue("value"));

  const auto                         dir = ScratchDir("cross_backup");
  stateshift::backup::BackupManager source_manager(*source, dir, 0);
  const auto                         path = source_manager.Backup(dir / (from.name + ".json"));

  auto                               target = to.make_backend();
  stateshift::backup::BackupManager target_manager(*target, dir, 0);

  bool rejected = false;
  try {
    target_manager.Restore(path);
  } catch (const DatabaseError&) {
    rejected = true;
  }
  assert(rejected);

  target_manager.Restore(path, true);
  assert(Equals(target->ExportData(), source->ExportData()));

  source->Clear();
  target->Clear();
}

BackendFactory MakeJsonFactory() {
  const auto path = ScratchDir("json") / "store.json";
  fs::remove_all(path.parent_path());

  return BackendFactory{
      .name = "json",
      .make_backend =
          [path]() -> std::unique_ptr<Backend> {
        stateshift::db::json::JsonBackendOptions options;
        options.path = path;
        auto backend = std::make_unique<stateshift::db::json::JsonBackend>(options);
        backend->Initialize();
        return backend;
      },
      .cleanup = [path]() { fs::remove_all(path.parent_path()); },
  };
}

#if STATESHIFT_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto path = ScratchDir("sqlite") / "store.db";
  fs::remove_all(path.parent_path());

  return BackendFactory{
      .name = "sqlite",
      .make_backend =
          [path]() -> std::unique_ptr<Backend> {
        stateshift::db::sqlite::SqliteBackendOptions options;
        options.path = path;
        auto backend = std::make_unique<stateshift::db::sqlite::SqliteBackend>(options);
        backend->Initialize();
        return backend;
      },
      .cleanup = [path]() { fs::remove_all(path.parent_path()); },
  };
}
#endif

#if STATESHIFT_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("STATESHIFT_TEST_PG_CONNINFO");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("STATESHIFT_TEST_PG_CONNINFO is not set");
  }

  const auto conninfo = std::string(uri);
  return BackendFactory{
      .name = "postgresql",
      .make_backend =
          [conninfo]() -> std::unique_ptr<Backend> {
        stateshift::db::postgres::PgBackendOptions options;
        options.conninfo  = conninfo;
        options.pool_size = 2;
        auto backend      = std::make_unique<stateshift::db::postgres::PgBackend>(options);
        backend->Initialize();
        return backend;
      },
      .cleanup = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& factory) {
  std::cout << "running backend suite: " << factory.name << "\n";
  {
    auto backend = factory.make_backend();
    backend->Clear();

    VerifyKeyValueContract(*backend);
    VerifyRollbackIsExact(*backend);
    VerifyNestedScopes(*backend);
    VerifyImportReplacesKeyspace(*backend);
    VerifyMigrationScenario(*backend, false);
    VerifyMigrationScenario(*backend, true);
    backend->Close();
  }

  VerifyRestartDurability(factory);
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeJsonFactory());

#if STATESHIFT_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if STATESHIFT_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgresql integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& factory : backends) {
    RunBackendSuite(factory);
  }

  if (backends.size() > 1) {
    VerifyBackupMovesAcrossBackends(backends[0], backends[1]);
  }

  for (auto& factory : backends) {
    factory.cleanup();
  }

  std::cout << "stateshift_integration_backend_parity: pass\n";
  return 0;
}
