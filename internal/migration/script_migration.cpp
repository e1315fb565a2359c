#include "script_migration.hpp"

#include <yaml-cpp/yaml.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/yaml_value.hpp"

namespace stateshift::migration {

using observability::IntField;
using observability::StringField;
using util::MigrationError;

namespace {

std::string RequireScalar(const YAML::Node& node, const char* what) {
  if (!node || !node.IsScalar() || node.Scalar().empty()) {
    throw std::invalid_argument(std::string(what) + " must be a non-empty string");
  }
  return node.Scalar();
}

ScriptMigration::Operation ParseOperation(const YAML::Node& node) {
  if (!node.IsMap() || node.size() != 1) {
    throw std::invalid_argument("each operation must be a single-key map");
  }

  const auto  entry = *node.begin();
  const auto  verb  = entry.first.as<std::string>();
  const auto& args  = entry.second;

  ScriptMigration::Operation op;
  if (verb == "set") {
    if (!args.IsMap() || !args["value"]) {
      throw std::invalid_argument("set requires {key, value}");
    }
    op.kind  = ScriptMigration::Operation::Kind::kSet;
    op.key   = RequireScalar(args["key"], "set.key");
    op.value = util::YamlToProtoValue(args["value"]);
  } else if (verb == "delete") {
    op.kind = ScriptMigration::Operation::Kind::kDelete;
    op.key  = RequireScalar(args, "delete");
  } else if (verb == "delete_prefix") {
    op.kind = ScriptMigration::Operation::Kind::kDeletePrefix;
    op.key  = RequireScalar(args, "delete_prefix");
  } else if (verb == "rename") {
    if (!args.IsMap()) {
      throw std::invalid_argument("rename requires {from, to}");
    }
    op.kind   = ScriptMigration::Operation::Kind::kRename;
    op.key    = RequireScalar(args["from"], "rename.from");
    op.target = RequireScalar(args["to"], "rename.to");
  } else {
    throw std::invalid_argument("unknown operation '" + verb + "'");
  }
  return op;
}

std::vector<ScriptMigration::Operation> ParseOperations(const YAML::Node& node, const char* section) {
  std::vector<ScriptMigration::Operation> ops;
  if (!node || node.IsNull()) return ops;
  if (!node.IsSequence()) {
    throw std::invalid_argument(std::string(section) + " must be a list of operations");
  }
  ops.reserve(node.size());
  for (const auto& item : node) {
    ops.push_back(ParseOperation(item));
  }
  return ops;
}

} // namespace

std::unique_ptr<ScriptMigration> ScriptMigration::Load(const std::filesystem::path& path, std::int64_t version, std::string name) {
  std::unique_ptr<ScriptMigration> unit(new ScriptMigration());
  unit->path_             = path;
  unit->metadata_.version = version;
  unit->metadata_.name    = std::move(name);

  try {
    const auto doc = YAML::LoadFile(path.string());
    if (!doc.IsNull() && !doc.IsMap()) {
      throw std::invalid_argument("top level must be a map");
    }

    if (const auto declared = doc["version"]) {
      if (declared.as<std::int64_t>() != version) {
        throw std::invalid_argument("declared version " + declared.as<std::string>() + " does not match file name");
      }
    }

    if (const auto description = doc["description"]) {
      unit->metadata_.description = description.as<std::string>("");
    }

    if (const auto deps = doc["dependencies"]) {
      if (!deps.IsNull() && !deps.IsSequence()) {
        throw std::invalid_argument("dependencies must be a list of versions");
      }
      for (const auto& dep : deps) {
        unit->metadata_.dependencies.insert(dep.as<std::int64_t>());
      }
    }

    unit->metadata_.risky            = doc["risky"].as<bool>(false);
    unit->metadata_.data_destructive = doc["data_destructive"].as<bool>(false);

    if (!doc["up"]) {
      throw std::invalid_argument("missing 'up' section");
    }
    unit->up_ = ParseOperations(doc["up"], "up");

    if (const auto down = doc["down"]) {
      unit->has_down_ = true;
      unit->down_     = ParseOperations(down, "down");
    }
  } catch (const std::exception& e) {
    throw MigrationError(version, unit->metadata_.name, "Invalid migration file " + path.string() + ": " + e.what());
  }

  return unit;
}

void ScriptMigration::Apply(db::Backend& backend, const RuntimeConfig&) const {
  Execute(backend, up_);
}

void ScriptMigration::Revert(db::Backend& backend, const RuntimeConfig&) const {
  if (!has_down_) {
    throw MigrationError(Version(), Name(), "Migration " + Name() + " has no 'down' section");
  }
  Execute(backend, down_);
}

void ScriptMigration::Execute(db::Backend& backend, const std::vector<Operation>& ops) const {
  for (const auto& op : ops) {
    switch (op.kind) {
      case Operation::Kind::kSet:
        backend.Set(op.key, op.value);
        break;

      case Operation::Kind::kDelete:
        backend.Delete(op.key);
        break;

      case Operation::Kind::kDeletePrefix: {
        const auto keys = backend.ListKeys(op.key);
        for (const auto& key : keys) {
          backend.Delete(key);
        }
        STATESHIFT_LOG_DEBUG("Deleted keys by prefix", {StringField("prefix", op.key), IntField("count", static_cast<std::int64_t>(keys.size()))});
        break;
      }

      case Operation::Kind::kRename: {
        auto value = backend.Get(op.key);
        if (!value) {
          throw MigrationError(Version(), Name(), "rename source '" + op.key + "' does not exist");
        }
        backend.Set(op.target, *value);
        backend.Delete(op.key);
        break;
      }
    }
  }
}

std::string ScriptMigration::ContentHash() const {
  return util::Sha256File(path_);
}

} // namespace stateshift::migration
