#pragma once

#include <cstdint>
#include <functional>
#include <set>
#include <string>

#include "config/config.pb.h"
#include "internal/db/api/backend.hpp"

namespace stateshift::migration {

using RuntimeConfig = stateshift::runtime::config::RuntimeConfig;

struct MigrationMetadata {
  std::int64_t           version = 0;
  std::string            name;
  std::string            description;
  std::set<std::int64_t> dependencies;

  // Take a backup before applying.
  bool risky = false;

  // Reverting may lose data.
  bool data_destructive = false;
};

/*
  MigrationUnit

  Stateless forward/backward pair plus metadata. Apply and Revert receive the
  backend inside an open transaction and must not open their own boundary
  expecting it to be independent.

  ContentHash() is recomputed on every call; it is what History records and
  what the integrity check compares against.
*/
class MigrationUnit {
 public:
  virtual ~MigrationUnit() = default;

  virtual const MigrationMetadata& Metadata() const = 0;

  std::int64_t Version() const {
    return Metadata().version;
  }

  const std::string& Name() const {
    return Metadata().name;
  }

  virtual void Apply(db::Backend& backend, const RuntimeConfig& config) const = 0;

  virtual bool CanRevert() const = 0;

  // Throws util::MigrationError when CanRevert() is false.
  virtual void Revert(db::Backend& backend, const RuntimeConfig& config) const = 0;

  virtual std::string ContentHash() const = 0;
};

using MigrationFn = std::function<void(db::Backend&, const RuntimeConfig&)>;

struct MigrationDefinition {
  MigrationMetadata metadata;
  MigrationFn       apply;
  MigrationFn       revert;

  // Hashed for History. Defaults to the unit name when empty.
  std::string source;
};

/*
  Unit registered from code through an explicit table.
*/
class FunctionMigration final : public MigrationUnit {
 public:
  explicit FunctionMigration(MigrationDefinition definition);

  const MigrationMetadata& Metadata() const override {
    return definition_.metadata;
  }

  void Apply(db::Backend& backend, const RuntimeConfig& config) const override;

  bool CanRevert() const override {
    return static_cast<bool>(definition_.revert);
  }

  void Revert(db::Backend& backend, const RuntimeConfig& config) const override;

  std::string ContentHash() const override;

 private:
  MigrationDefinition definition_;
};

} // namespace stateshift::migration
