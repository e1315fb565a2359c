#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/backend.hpp"

namespace stateshift::backup {

/*
  On-disk backup document. Exactly four fields:

    {
      "backend_type":   "json" | "sqlite" | "postgresql",
      "schema_version": 202501020000,
      "created_at":     "2025-01-02T00:00:00Z",
      "data":           { key: value, ... }
    }
*/
struct BackupSnapshot {
  std::string  backend_type;
  std::int64_t schema_version = 0;
  std::string  created_at;
  db::DataMap  data;
};

std::string    EncodeSnapshot(const BackupSnapshot& snapshot);
BackupSnapshot DecodeSnapshot(const std::string& json); // throws util::DatabaseError

/*
  BackupManager

  Snapshot and restore share the backend transaction primitive with the
  migration runner, so they never interleave with an in-flight unit.
*/
class BackupManager {
 public:
  // `retention` == 0 keeps every auto-named backup.
  BackupManager(db::Backend& backend, std::filesystem::path backup_dir, std::size_t retention);

  // Writes a snapshot to `target`, or to an auto-named file in the backup
  // directory when none is given. Throws util::DatabaseError.
  std::filesystem::path Backup(const std::optional<std::filesystem::path>& target = std::nullopt);

  // Replaces the whole keyspace with the snapshot at `path`. Backend type or
  // schema version mismatches raise util::DatabaseError unless `force`.
  void Restore(const std::filesystem::path& path, bool force = false);

  // Auto-named backups of this backend type, newest first.
  std::vector<std::filesystem::path> ListBackups() const;

  BackupSnapshot TakeSnapshot();

  const std::filesystem::path& BackupDir() const {
    return backup_dir_;
  }

 private:
  std::string           FilePrefix() const;
  std::filesystem::path NextAutoPath() const;
  void        ApplyRetention();

  db::Backend&          backend_;
  std::filesystem::path backup_dir_;
  std::size_t           retention_;
};

} // namespace stateshift::backup
