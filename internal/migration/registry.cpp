#include "registry.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "script_migration.hpp"

namespace stateshift::migration {

using observability::IntField;
using observability::StringField;
using util::MigrationError;

namespace {

bool AllDigits(const std::string& text, std::size_t length = 0) {
  if (text.empty() || (length != 0 && text.size() != length)) return false;
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool ValidUnitName(const std::string& name) {
  return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isalnum(c) != 0 || c == '_' || c == '-'; });
}

} // namespace

void MigrationRegistry::Register(UnitPtr unit) {
  if (!unit) {
    throw MigrationError("cannot register a null migration");
  }

  const auto& meta = unit->Metadata();
  if (meta.version <= 0) {
    throw MigrationError(meta.version, meta.name, "Migration version must be positive: " + meta.name);
  }

  if (auto it = units_.find(meta.version); it != units_.end()) {
    throw MigrationError(meta.version, meta.name,
                         "Duplicate migration version " + std::to_string(meta.version) + ": " + it->second->Name() + " and " + meta.name);
  }

  for (const auto dep : meta.dependencies) {
    if (dep >= meta.version) {
      throw MigrationError(meta.version, meta.name,
                           "Migration " + meta.name + " depends on version " + std::to_string(dep) + ", which is not older than itself");
    }
  }

  units_.emplace(meta.version, std::move(unit));
}

void MigrationRegistry::Register(MigrationDefinition definition) {
  Register(std::make_shared<FunctionMigration>(std::move(definition)));
}

std::size_t MigrationRegistry::LoadDirectory(const std::filesystem::path& dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    STATESHIFT_LOG_DEBUG("Migrations directory not found", {StringField("path", dir.string())});
    return 0;
  }

  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;

    const auto& path = entry.path();
    const auto  ext  = path.extension().string();
    if (ext != ".yaml" && ext != ".yml") continue;
    if (path.filename().string().starts_with("__")) continue;

    files.push_back(path);
  }
  std::sort(files.begin(), files.end());

  std::size_t loaded = 0;
  for (const auto& path : files) {
    const auto parsed = ParseFileName(path.stem().string());
    if (!parsed) {
      STATESHIFT_LOG_WARN("Invalid migration filename", {StringField("path", path.string())});
      continue;
    }

    Register(ScriptMigration::Load(path, parsed->version, parsed->name));
    loaded_.insert(parsed->version);
    ++loaded;
  }

  STATESHIFT_LOG_DEBUG("Loaded migrations", {StringField("path", dir.string()), IntField("count", static_cast<std::int64_t>(loaded))});
  return loaded;
}

void MigrationRegistry::ClearLoaded() {
  for (const auto version : loaded_) {
    units_.erase(version);
  }
  loaded_.clear();
}

std::vector<MigrationRegistry::UnitPtr> MigrationRegistry::Ordered() const {
  std::vector<UnitPtr> out;
  out.reserve(units_.size());
  for (const auto& [version, unit] : units_) {
    out.push_back(unit);
  }
  return out;
}

MigrationRegistry::UnitPtr MigrationRegistry::Find(std::int64_t version) const {
  auto it = units_.find(version);
  return it == units_.end() ? nullptr : it->second;
}

std::optional<MigrationRegistry::ParsedFileName> MigrationRegistry::ParseFileName(const std::string& stem) {
  const auto first_sep = stem.find('_');
  if (first_sep == std::string::npos || first_sep + 1 >= stem.size()) {
    return std::nullopt;
  }

  const auto   first = stem.substr(0, first_sep);
  std::string  digits;
  std::string  rest = stem.substr(first_sep + 1);

  if (AllDigits(first, 14)) {
    digits = first;
  } else if (AllDigits(first, 8)) {
    // YYYYMMDD_HHMMSS_name, otherwise a plain <digits>_name.
    const auto second_sep = rest.find('_');
    const auto second     = rest.substr(0, second_sep);
    if (second_sep != std::string::npos && AllDigits(second, 6)) {
      if (second_sep + 1 >= rest.size()) return std::nullopt;
      digits = first + second;
    } else {
      digits = first;
    }
  } else if (AllDigits(first) && first.size() <= 18) {
    digits = first;
  } else {
    return std::nullopt;
  }

  const auto version = std::stoll(digits);
  if (version <= 0) return std::nullopt;

  return ParsedFileName{version, stem};
}

std::filesystem::path MigrationRegistry::CreateMigrationFile(const std::filesystem::path& dir,
                                                             const std::string&           name,
                                                             const std::string&           description,
                                                             util::TimePoint              now) {
  if (!ValidUnitName(name)) {
    throw MigrationError("Migration name must be non-empty and use only letters, digits, '_' or '-': '" + name + "'");
  }

  const auto version = util::VersionStamp(now);
  const auto path    = dir / (std::to_string(version) + "_" + name + ".yaml");

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw MigrationError("Failed to create migrations directory " + dir.string() + ": " + ec.message());
  }
  if (std::filesystem::exists(path)) {
    throw MigrationError(version, name, "Migration file already exists: " + path.string());
  }

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "version" << YAML::Value << version;
  out << YAML::Key << "description" << YAML::Value << YAML::DoubleQuoted << description;
  out << YAML::Key << "dependencies" << YAML::Value << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
  out << YAML::Key << "risky" << YAML::Value << false;
  out << YAML::Key << "data_destructive" << YAML::Value << false;
  out << YAML::Key << "up" << YAML::Value << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
  out << YAML::Key << "down" << YAML::Value << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
  out << YAML::EndMap;

  std::ofstream file(path);
  file << "# Migration: " << name << "\n";
  file << "# Created: " << util::ToIso8601(now) << "\n";
  file << out.c_str() << "\n";
  if (!file) {
    throw MigrationError(version, name, "Failed to write migration file: " + path.string());
  }

  STATESHIFT_LOG_INFO("Created migration", {StringField("path", path.string())});
  return path;
}

} // namespace stateshift::migration
