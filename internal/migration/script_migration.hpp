#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/db/api/document.hpp"
#include "migration.hpp"

namespace stateshift::migration {

/*
  ScriptMigration

  Declarative unit stored as a YAML file in the migrations directory:

    description: Seed settings
    dependencies: [20250101000000]
    risky: false
    data_destructive: false
    up:
      - set: {key: settings, value: {theme: dark}}
      - rename: {from: old_settings, to: legacy_settings}
    down:
      - delete: settings
      - delete_prefix: "cache:"

  Version and name come from the file name; a `version` entry, when present,
  must agree with it. Operations are parsed eagerly so a malformed file is
  rejected at discovery time, never half way through Apply.
*/
class ScriptMigration final : public MigrationUnit {
 public:
  struct Operation {
    enum class Kind { kSet, kDelete, kDeletePrefix, kRename };

    Kind         kind;
    std::string  key;
    std::string  target; // rename destination
    db::Document value;
  };

  // Throws util::MigrationError on unreadable or malformed files.
  static std::unique_ptr<ScriptMigration> Load(const std::filesystem::path& path, std::int64_t version, std::string name);

  const MigrationMetadata& Metadata() const override {
    return metadata_;
  }

  void Apply(db::Backend& backend, const RuntimeConfig& config) const override;

  bool CanRevert() const override {
    return has_down_;
  }

  void Revert(db::Backend& backend, const RuntimeConfig& config) const override;

  // SHA-256 of the file as it is on disk now. Throws if it disappeared.
  std::string ContentHash() const override;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  ScriptMigration() = default;

  void Execute(db::Backend& backend, const std::vector<Operation>& ops) const;

  std::filesystem::path  path_;
  MigrationMetadata      metadata_;
  std::vector<Operation> up_;
  std::vector<Operation> down_;
  bool                   has_down_ = false;
};

} // namespace stateshift::migration
