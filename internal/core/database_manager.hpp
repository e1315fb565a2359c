#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/backup/backup_manager.hpp"
#include "internal/db/api/backend.hpp"
#include "internal/migration/history_store.hpp"
#include "internal/migration/integrity_verifier.hpp"
#include "internal/migration/migration_runner.hpp"
#include "internal/migration/registry.hpp"

namespace stateshift::core {

/*
  DatabaseManager

  The only entry point collaborators call. Owns one backend, the migration
  registry and runner, and the backup manager.

  Initialize():
    1. validate config (ConfigurationError, no I/O yet)
    2. create + open the configured backend
    3. load migration files from database.migrations_path
    4. apply pending migrations

  If step 4 fails the manager stays initialized so callers can inspect
  SchemaVersion()/MigrationHistory() and retry.

  Not thread-safe apart from the runner's own overlap guard.
*/
class DatabaseManager {
 public:
  explicit DatabaseManager(stateshift::runtime::config::RuntimeConfig config);
  ~DatabaseManager();

  DatabaseManager(const DatabaseManager&)            = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

  // Units defined in code. Must be registered before Initialize().
  void Register(migration::MigrationDefinition definition);

  void Initialize();
  void Close();
  bool IsInitialized() const;

  // Throws util::DatabaseError before Initialize().
  db::Backend& GetBackend();

  std::size_t RunMigrations();
  std::size_t RollbackMigration(std::size_t steps = 1);
  std::size_t RollbackToVersion(std::int64_t version);

  std::filesystem::path Backup(const std::optional<std::filesystem::path>& path = std::nullopt);
  void                  Restore(const std::filesystem::path& path, bool force = false);
  std::vector<std::filesystem::path> ListBackups();

  // Never throws; failures are reported in the "error" field.
  db::Document HealthStatus();

  migration::IntegrityReport              VerifyIntegrity();
  std::vector<migration::MigrationRecord> MigrationHistory();
  std::vector<migration::RollbackRecord>  RollbackHistory();
  migration::RollbackSafety               CheckRollbackSafety(std::int64_t version);
  std::vector<migration::MigrationStatus> LastBatch();

  std::filesystem::path CreateMigration(const std::string& name, const std::string& description = "");

  std::int64_t SchemaVersion();

  const stateshift::runtime::config::RuntimeConfig& Config() const {
    return config_;
  }

 private:
  void                  RequireInitialized() const;
  std::filesystem::path DefaultBackupDir() const;

  stateshift::runtime::config::RuntimeConfig config_;
  migration::MigrationRegistry               registry_;

  std::unique_ptr<db::Backend>                backend_;
  std::unique_ptr<backup::BackupManager>      backup_;
  std::unique_ptr<migration::MigrationRunner> runner_;
};

} // namespace stateshift::core
