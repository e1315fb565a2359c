#include "backup_manager.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <system_error>

#include "internal/db/api/backend_type.hpp"
#include "internal/migration/history_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/time.hpp"

namespace stateshift::backup {

namespace fs = std::filesystem;

using observability::BoolField;
using observability::IntField;
using observability::StringField;
using util::DatabaseError;

namespace {

void WriteAtomically(const fs::path& path, const std::string& contents) {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }

  auto tmp_path = path;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw DatabaseError("cannot open " + tmp_path.string());
    }
    out << contents;
    out.flush();
    if (!out) {
      throw DatabaseError("short write to " + tmp_path.string());
    }
  }
  fs::rename(tmp_path, path);
}

} // namespace

std::string EncodeSnapshot(const BackupSnapshot& snapshot) {
  auto doc = db::EmptyObject();
  *db::MutableField(doc, "backend_type")   = db::StringValue(snapshot.backend_type);
  *db::MutableField(doc, "schema_version") = db::IntValue(snapshot.schema_version);
  *db::MutableField(doc, "created_at")     = db::StringValue(snapshot.created_at);
  *db::MutableField(doc, "data")           = db::ToDocument(snapshot.data);
  return db::EncodeJson(doc, true);
}

BackupSnapshot DecodeSnapshot(const std::string& json) {
  db::Document doc;
  try {
    doc = db::DecodeJson(json);
  } catch (const std::exception& e) {
    throw DatabaseError("Invalid backup format: " + std::string(e.what()));
  }

  for (const char* field : {"backend_type", "schema_version", "data"}) {
    if (!db::Field(doc, field)) {
      throw DatabaseError(std::string("Invalid backup format: missing ") + field);
    }
  }

  const auto* data = db::Field(doc, "data");
  if (data->kind_case() != google::protobuf::Value::kStructValue) {
    throw DatabaseError("Invalid backup format: data is not an object");
  }

  BackupSnapshot snapshot;
  snapshot.backend_type = db::Field(doc, "backend_type")->string_value();
  try {
    snapshot.schema_version = db::AsInt(*db::Field(doc, "schema_version"));
  } catch (const util::StorageError& e) {
    throw DatabaseError("Invalid backup format: schema_version " + std::string(e.what()));
  }
  if (const auto* created_at = db::Field(doc, "created_at")) {
    snapshot.created_at = created_at->string_value();
  }
  snapshot.data = db::ToDataMap(*data);
  return snapshot;
}

BackupManager::BackupManager(db::Backend& backend, fs::path backup_dir, std::size_t retention)
    : backend_(backend), backup_dir_(std::move(backup_dir)), retention_(retention) {
}

std::string BackupManager::FilePrefix() const {
  return "backup_" + db::ToString(backend_.Type()) + "_";
}

// Backups taken within the same microsecond get a counter suffix, which
// still sorts after the unsuffixed name.
fs::path BackupManager::NextAutoPath() const {
  const auto stem = FilePrefix() + util::FileStampMicros(util::Now());
  auto       path = backup_dir_ / (stem + ".json");

  char suffix[16];
  for (int i = 1; fs::exists(path); ++i) {
    std::snprintf(suffix, sizeof(suffix), "_%03d", i);
    path = backup_dir_ / (stem + suffix + ".json");
  }
  return path;
}

BackupSnapshot BackupManager::TakeSnapshot() {
  BackupSnapshot snapshot;
  snapshot.backend_type = db::ToString(backend_.Type());

  // Version and data are read under one transaction so they agree.
  db::RunInTransaction(backend_, [&] {
    snapshot.schema_version = migration::HistoryStore(backend_).SchemaVersion();
    snapshot.data           = backend_.ExportData();
  });
  snapshot.created_at = util::ToIso8601(util::Now());
  return snapshot;
}

fs::path BackupManager::Backup(const std::optional<fs::path>& target) {
  const bool auto_named = !target.has_value();
  const auto path       = auto_named ? NextAutoPath() : *target;

  try {
    const auto snapshot = TakeSnapshot();
    WriteAtomically(path, EncodeSnapshot(snapshot));

    STATESHIFT_LOG_INFO("Database backup created",
                        {StringField("path", path.string()), IntField("schema_version", snapshot.schema_version), IntField("keys", static_cast<std::int64_t>(snapshot.data.size()))});
  } catch (const std::exception& e) {
    STATESHIFT_LOG_ERROR("Backup failed", {StringField("path", path.string()), StringField("error", e.what())});
    throw DatabaseError("Backup failed: " + std::string(e.what()));
  }

  if (auto_named) {
    ApplyRetention();
  }
  return path;
}

void BackupManager::Restore(const fs::path& path, bool force) {
  try {
    std::string contents;
    try {
      contents = util::ReadFile(path);
    } catch (const std::exception& e) {
      throw DatabaseError("cannot read " + path.string() + ": " + e.what());
    }

    const auto snapshot = DecodeSnapshot(contents);
    const auto current_type = db::ToString(backend_.Type());

    if (snapshot.backend_type != current_type && !force) {
      throw DatabaseError("Backend mismatch: backup is " + snapshot.backend_type + ", current is " + current_type + ". Use force to override.");
    }

    db::RunInTransaction(backend_, [&] {
      const auto current_version = migration::HistoryStore(backend_).SchemaVersion();
      if (snapshot.schema_version != current_version && !force) {
        throw DatabaseError("Schema version mismatch: backup is " + std::to_string(snapshot.schema_version) + ", current is " +
                            std::to_string(current_version) + ". Use force to override.");
      }
      backend_.ImportData(snapshot.data);
    });

    STATESHIFT_LOG_INFO("Database restored",
                        {StringField("path", path.string()), IntField("schema_version", snapshot.schema_version), BoolField("force", force)});
  } catch (const DatabaseError& e) {
    STATESHIFT_LOG_ERROR("Restore failed", {StringField("path", path.string()), StringField("error", e.what())});
    throw;
  } catch (const std::exception& e) {
    STATESHIFT_LOG_ERROR("Restore failed", {StringField("path", path.string()), StringField("error", e.what())});
    throw DatabaseError("Restore failed: " + std::string(e.what()));
  }
}

std::vector<fs::path> BackupManager::ListBackups() const {
  std::vector<fs::path> out;

  std::error_code ec;
  if (!fs::is_directory(backup_dir_, ec)) return out;

  const auto prefix = FilePrefix();
  for (const auto& entry : fs::directory_iterator(backup_dir_)) {
    if (!entry.is_regular_file()) continue;
    const auto name = entry.path().filename().string();
    if (name.starts_with(prefix) && name.ends_with(".json")) {
      out.push_back(entry.path());
    }
  }

  // Stamps sort lexicographically.
  std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) { return a.filename() > b.filename(); });
  return out;
}

void BackupManager::ApplyRetention() {
  if (retention_ == 0) return;

  const auto backups = ListBackups();
  for (std::size_t i = retention_; i < backups.size(); ++i) {
    std::error_code ec;
    fs::remove(backups[i], ec);
    if (ec) {
      STATESHIFT_LOG_WARN("Failed to prune old backup", {StringField("path", backups[i].string()), StringField("error", ec.message())});
    } else {
      STATESHIFT_LOG_DEBUG("Pruned old backup", {StringField("path", backups[i].string())});
    }
  }
}

} // namespace stateshift::backup
