#include "config_loader.hpp"

#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

#include "internal/db/api/backend_type.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/yaml_value.hpp"

namespace stateshift::config {

using stateshift::runtime::config::RuntimeConfig;
using util::ConfigurationError;

namespace {

uint32_t ParseUnsigned(const char* name, const std::string& text) {
  try {
    std::size_t consumed = 0;
    const auto  value    = std::stoull(text, &consumed);
    if (consumed != text.size() || value > std::numeric_limits<uint32_t>::max()) {
      throw std::invalid_argument(text);
    }
    return static_cast<uint32_t>(value);
  } catch (const std::exception&) {
    throw ConfigurationError(std::string(name) + " must be a non-negative integer, got '" + text + "'");
  }
}

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  try {
    util::YamlToProtoValue(yaml, &json_value);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to convert YAML config: " + std::string(e.what()));
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config = Defaults();

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  RuntimeConfig parsed;
  auto          status = google::protobuf::util::JsonStringToMessage(json, &parsed, options);
  if (!status.ok()) {
    throw ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  // Explicit values win over defaults; zero/empty means "not set" in proto3.
  config.MergeFrom(parsed);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  auto*         db = config.mutable_database();
  db->set_backend("sqlite");
  db->set_connection_string("data/app.db");
  db->set_migrations_path("migrations");
  db->set_cache_size(100);
  db->set_pool_size(5);
  db->set_timeout_seconds(30);
  db->set_backup_retention(7);
  db->set_auto_save(true);
  db->set_file_backup_count(3);
  config.mutable_logging()->set_level("info");
  return config;
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig& config) {
  auto* db = config.mutable_database();

  if (const char* v = Env("STATESHIFT_DB_BACKEND")) db->set_backend(v);
  if (const char* v = Env("STATESHIFT_DB_CONNECTION_STRING")) db->set_connection_string(v);
  if (const char* v = Env("STATESHIFT_DB_MIGRATIONS_PATH")) db->set_migrations_path(v);
  if (const char* v = Env("STATESHIFT_DB_BACKUP_DIR")) db->set_backup_dir(v);
  if (const char* v = Env("STATESHIFT_DB_CACHE_SIZE")) db->set_cache_size(ParseUnsigned("STATESHIFT_DB_CACHE_SIZE", v));
  if (const char* v = Env("STATESHIFT_DB_POOL_SIZE")) db->set_pool_size(ParseUnsigned("STATESHIFT_DB_POOL_SIZE", v));
  if (const char* v = Env("STATESHIFT_DB_TIMEOUT")) db->set_timeout_seconds(ParseUnsigned("STATESHIFT_DB_TIMEOUT", v));
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& db   = config.database();
  const auto  type = db::ParseBackendType(db.backend());

  if (db.connection_string().empty()) {
    throw ConfigurationError("database.connection_string must not be empty");
  }

  if (type == db::BackendType::kPostgresql && db.pool_size() == 0) {
    throw ConfigurationError("database.pool_size must be positive for postgresql");
  }

  if (db.timeout_seconds() > static_cast<std::uint32_t>(db::kMaxTimeoutSeconds)) {
    throw ConfigurationError("database.timeout_seconds must not exceed " + std::to_string(db::kMaxTimeoutSeconds));
  }
}

} // namespace stateshift::config
