#include "internal/migration/integrity_verifier.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/json/json_backend.hpp"
#include "internal/migration/migration_runner.hpp"

namespace {

namespace fs = std::filesystem;

using stateshift::db::json::JsonBackend;
using stateshift::db::json::JsonBackendOptions;
using stateshift::migration::HistoryStore;
using stateshift::migration::IntegrityVerifier;
using stateshift::migration::MigrationRegistry;
using stateshift::migration::MigrationRunner;
using stateshift::migration::RuntimeConfig;

constexpr std::int64_t kV1 = 20250101000000;
constexpr std::int64_t kV2 = 20250102000000;

fs::path FreshDir(const std::string& test_name) {
  const auto dir = fs::temp_directory_path() / "stateshift_integrity_tests" / test_name;
  fs::remove_all(dir);
  fs::create_directories(dir / "migrations");
  return dir;
}

void WriteFile(const fs::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::trunc);
  out << contents;
}

void WriteScripts(const fs::path& migrations) {
  WriteFile(migrations / "20250101000000_seed.yaml",
            "description: Seed settings\n"
            "up:\n"
            "  - set: {key: settings, value: {theme: dark}}\n"
            "down:\n"
            "  - delete: settings\n");
  WriteFile(migrations / "20250102000000_flags.yaml",
            "dependencies: [20250101000000]\n"
            "up:\n"
            "  - set: {key: flags, value: [a, b]}\n"
            "down:\n"
            "  - delete: flags\n");
}

std::unique_ptr<JsonBackend> OpenBackend(const fs::path& dir) {
  JsonBackendOptions options;
  options.path = dir / "store.json";
  auto backend = std::make_unique<JsonBackend>(options);
  backend->Initialize();
  return backend;
}

void TestUntouchedSourcesVerifyClean() {
  const auto dir = FreshDir("clean");
  WriteScripts(dir / "migrations");
  auto backend = OpenBackend(dir);

  MigrationRegistry registry;
  assert(registry.LoadDirectory(dir / "migrations") == 2);
  MigrationRunner(*backend, registry, RuntimeConfig{}).Run();

  const auto report = IntegrityVerifier(registry).Verify(HistoryStore(*backend).History());
  assert(report.checked == 2);
  assert(report.Ok());
  assert(report.missing.empty());
}

void TestEditedSourceIsReportedAsMismatch() {
  const auto dir = FreshDir("edited");
  WriteScripts(dir / "migrations");
  auto backend = OpenBackend(dir);

  MigrationRegistry registry;
  registry.LoadDirectory(dir / "migrations");
  MigrationRunner(*backend, registry, RuntimeConfig{}).Run();

  {
    std::ofstream out(dir / "migrations" / "20250101000000_seed.yaml", std::ios::app);
    out << "# edited after apply\n";
  }

  const auto history = HistoryStore(*backend).History();
  const auto report  = IntegrityVerifier(registry).Verify(history);
  assert(!report.Ok());
  assert(report.mismatches.size() == 1);
  assert(report.mismatches[0].version == kV1);
  assert(report.mismatches[0].recorded_hash == history[0].file_hash);
  assert(report.mismatches[0].current_hash != history[0].file_hash);
  assert(report.missing.empty());

  // Reports only; History keeps the original hash.
  assert(HistoryStore(*backend).History()[0].file_hash == history[0].file_hash);
}

void TestMissingSourceIsReportedSeparately() {
  const auto dir = FreshDir("missing");
  WriteScripts(dir / "migrations");
  auto backend = OpenBackend(dir);

  {
    MigrationRegistry registry;
    registry.LoadDirectory(dir / "migrations");
    MigrationRunner(*backend, registry, RuntimeConfig{}).Run();
  }

  fs::remove(dir / "migrations" / "20250102000000_flags.yaml");

  MigrationRegistry reloaded;
  reloaded.LoadDirectory(dir / "migrations");

  const auto report = IntegrityVerifier(reloaded).Verify(HistoryStore(*backend).History());
  assert(report.checked == 2);
  assert(report.Ok());
  assert(report.missing.size() == 1);
  assert(report.missing[0].version == kV2);
  assert(report.missing[0].current_hash.empty());
}

void TestDeletedFileAfterLoadCountsAsMissing() {
  const auto dir = FreshDir("deleted_after_load");
  WriteScripts(dir / "migrations");
  auto backend = OpenBackend(dir);

  MigrationRegistry registry;
  registry.LoadDirectory(dir / "migrations");
  MigrationRunner(*backend, registry, RuntimeConfig{}).Run();

  fs::remove(dir / "migrations" / "20250101000000_seed.yaml");

  const auto report = IntegrityVerifier(registry).Verify(HistoryStore(*backend).History());
  assert(report.mismatches.empty());
  assert(report.missing.size() == 1);
  assert(report.missing[0].version == kV1);
}

} // namespace

int main() {
  TestUntouchedSourcesVerifyClean();
  TestEditedSourceIsReportedAsMismatch();
  TestMissingSourceIsReportedSeparately();
  TestDeletedFileAfterLoadCountsAsMissing();

  std::cout << "stateshift_unit_integrity_verifier: pass\n";
  return 0;
}
