#include "database_manager.hpp"

#include "internal/config/config_loader.hpp"
#include "internal/db/api/backend_type.hpp"
#include "internal/db/backend_factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace stateshift::core {

using observability::IntField;
using observability::StringField;
using util::ConfigurationError;
using util::DatabaseError;
using util::MigrationError;

DatabaseManager::DatabaseManager(stateshift::runtime::config::RuntimeConfig config) : config_(std::move(config)) {
}

DatabaseManager::~DatabaseManager() {
  try {
    Close();
  } catch (const std::exception& e) {
    STATESHIFT_LOG_WARN("Failed to close database", {StringField("error", e.what())});
  }
}

void DatabaseManager::Register(migration::MigrationDefinition definition) {
  registry_.Register(std::move(definition));
}

void DatabaseManager::Initialize() {
  if (backend_) return;

  try {
    config::ConfigLoader::Validate(config_);

    auto backend = db::CreateBackend(config_.database());
    backend->Initialize();
    backend_ = std::move(backend);

    registry_.ClearLoaded();
    registry_.LoadDirectory(config_.database().migrations_path());

    backup_ = std::make_unique<backup::BackupManager>(*backend_, DefaultBackupDir(), config_.database().backup_retention());

    migration::RunnerHooks hooks;
    hooks.before_risky_apply = [this](const migration::MigrationUnit&) { backup_->Backup(); };
    hooks.before_rollback    = [this] {
      STATESHIFT_LOG_INFO("Creating backup before rollback");
      backup_->Backup();
    };
    runner_ = std::make_unique<migration::MigrationRunner>(*backend_, registry_, config_, std::move(hooks));
  } catch (const ConfigurationError&) {
    throw;
  } catch (const MigrationError& e) {
    STATESHIFT_LOG_ERROR("Failed to initialize database", {StringField("error", e.what())});
    runner_.reset();
    backup_.reset();
    backend_.reset();
    throw;
  } catch (const std::exception& e) {
    STATESHIFT_LOG_ERROR("Failed to initialize database", {StringField("error", e.what())});
    runner_.reset();
    backup_.reset();
    backend_.reset();
    throw DatabaseError("Database initialization failed: " + std::string(e.what()));
  }

  RunMigrations();

  STATESHIFT_LOG_INFO("Database initialized",
                      {StringField("backend", config_.database().backend()), IntField("schema_version", SchemaVersion())});
}

void DatabaseManager::Close() {
  if (!backend_) return;

  runner_.reset();
  backup_.reset();
  backend_->Close();
  backend_.reset();
  STATESHIFT_LOG_INFO("Database connections closed");
}

bool DatabaseManager::IsInitialized() const {
  return backend_ != nullptr;
}

void DatabaseManager::RequireInitialized() const {
  if (!backend_) {
    throw DatabaseError("Database not initialized. Call Initialize() first.");
  }
}

db::Backend& DatabaseManager::GetBackend() {
  RequireInitialized();
  return *backend_;
}

std::filesystem::path DatabaseManager::DefaultBackupDir() const {
  const auto& db = config_.database();
  if (!db.backup_dir().empty()) {
    return db.backup_dir();
  }
  if (db::ParseBackendType(db.backend()) == db::BackendType::kJson) {
    const auto parent = std::filesystem::path(db.connection_string()).parent_path();
    if (!parent.empty()) return parent;
  }
  return std::filesystem::current_path();
}

// ------------------------------------------------------------------
// Migrations
// ------------------------------------------------------------------

std::size_t DatabaseManager::RunMigrations() {
  RequireInitialized();
  return runner_->Run();
}

std::size_t DatabaseManager::RollbackMigration(std::size_t steps) {
  RequireInitialized();
  return runner_->RollbackSteps(steps);
}

std::size_t DatabaseManager::RollbackToVersion(std::int64_t version) {
  RequireInitialized();
  return runner_->RollbackToVersion(version);
}

migration::IntegrityReport DatabaseManager::VerifyIntegrity() {
  RequireInitialized();
  return migration::IntegrityVerifier(registry_).Verify(migration::HistoryStore(*backend_).History());
}

std::vector<migration::MigrationRecord> DatabaseManager::MigrationHistory() {
  RequireInitialized();
  return migration::HistoryStore(*backend_).History();
}

std::vector<migration::RollbackRecord> DatabaseManager::RollbackHistory() {
  RequireInitialized();
  return migration::HistoryStore(*backend_).RollbackHistory();
}

migration::RollbackSafety DatabaseManager::CheckRollbackSafety(std::int64_t version) {
  RequireInitialized();
  return runner_->CheckRollbackSafety(version);
}

std::vector<migration::MigrationStatus> DatabaseManager::LastBatch() {
  RequireInitialized();
  return runner_->LastBatch();
}

std::filesystem::path DatabaseManager::CreateMigration(const std::string& name, const std::string& description) {
  return migration::MigrationRegistry::CreateMigrationFile(config_.database().migrations_path(), name, description);
}

std::int64_t DatabaseManager::SchemaVersion() {
  RequireInitialized();
  return migration::HistoryStore(*backend_).SchemaVersion();
}

// ------------------------------------------------------------------
// Backup / restore
// ------------------------------------------------------------------

std::filesystem::path DatabaseManager::Backup(const std::optional<std::filesystem::path>& path) {
  RequireInitialized();
  const auto guard = runner_->Exclusive("backup");
  return backup_->Backup(path);
}

void DatabaseManager::Restore(const std::filesystem::path& path, bool force) {
  RequireInitialized();
  const auto guard = runner_->Exclusive("restore");
  backup_->Restore(path, force);
}

std::vector<std::filesystem::path> DatabaseManager::ListBackups() {
  RequireInitialized();
  return backup_->ListBackups();
}

// ------------------------------------------------------------------
// Health
// ------------------------------------------------------------------

db::Document DatabaseManager::HealthStatus() {
  auto status = db::EmptyObject();
  *db::MutableField(status, "backend_type") = db::StringValue(config_.database().backend());
  *db::MutableField(status, "timestamp")    = db::StringValue(util::ToIso8601(util::Now()));

  try {
    *db::MutableField(status, "initialized") = db::BoolValue(backend_ != nullptr);
    if (!backend_) return status;

    *db::MutableField(status, "schema_version") = db::IntValue(SchemaVersion());

    const auto stats = backend_->Stats();
    for (const auto& [key, value] : stats.struct_value().fields()) {
      *db::MutableField(status, key) = value;
    }
  } catch (const std::exception& e) {
    STATESHIFT_LOG_ERROR("Health check failed", {StringField("error", e.what())});
    *db::MutableField(status, "initialized") = db::BoolValue(false);
    *db::MutableField(status, "error")       = db::StringValue(e.what());
  }
  return status;
}

} // namespace stateshift::core
