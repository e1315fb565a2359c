#include "migration.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace stateshift::migration {

FunctionMigration::FunctionMigration(MigrationDefinition definition) : definition_(std::move(definition)) {
  if (definition_.metadata.version <= 0) {
    throw util::MigrationError("Migration version must be positive: " + definition_.metadata.name);
  }
  if (!definition_.apply) {
    throw util::MigrationError(definition_.metadata.version, definition_.metadata.name,
                               "Migration " + definition_.metadata.name + " missing apply function");
  }
}

void FunctionMigration::Apply(db::Backend& backend, const RuntimeConfig& config) const {
  definition_.apply(backend, config);
}

void FunctionMigration::Revert(db::Backend& backend, const RuntimeConfig& config) const {
  if (!definition_.revert) {
    throw util::MigrationError(Version(), Name(), "Migration " + Name() + " has no revert function");
  }
  definition_.revert(backend, config);
}

std::string FunctionMigration::ContentHash() const {
  return util::Sha256Hex(definition_.source.empty() ? definition_.metadata.name : definition_.source);
}

} // namespace stateshift::migration
