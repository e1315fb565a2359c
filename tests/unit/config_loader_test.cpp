#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using stateshift::config::ConfigLoader;
using stateshift::util::ConfigurationError;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "stateshift_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestExplicitValuesOverrideDefaults() {
  const auto yaml_path = WriteYaml("explicit_values",
                                   R"(database:
  backend: json
  connection_string: "/var/lib/app/store.json"
  cache_size: 10
  auto_save: false
  options:
    seed_user: "admin"
logging:
  level: debug
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().backend() == "json");
  assert(config.database().connection_string() == "/var/lib/app/store.json");
  assert(config.database().cache_size() == 10);
  assert(config.database().has_auto_save() && !config.database().auto_save());
  assert(config.database().options().fields().at("seed_user").string_value() == "admin");
  assert(config.logging().level() == "debug");

  // Untouched fields keep their defaults.
  assert(config.database().migrations_path() == "migrations");
  assert(config.database().pool_size() == 5);
  assert(config.database().timeout_seconds() == 30);
  assert(config.database().backup_retention() == 7);
  assert(config.database().file_backup_count() == 3);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  backend: sqlite
  connection_string: "C:\\stateshift\\\"quoted\"\\db.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().connection_string() == "C:\\stateshift\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(database:
  backend: sqlite
  connection_string: "12345"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().connection_string() == "12345");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  backend: sqlite
  connection_string: "/tmp/data.db"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const ConfigurationError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsConfigurationError() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/stateshift/config.yaml");
  } catch (const ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestEnvironmentOverridesFileValues() {
  auto config = ConfigLoader::Defaults();

  setenv("STATESHIFT_DB_BACKEND", "json", 1);
  setenv("STATESHIFT_DB_CONNECTION_STRING", "/tmp/env.json", 1);
  setenv("STATESHIFT_DB_POOL_SIZE", "12", 1);
  ConfigLoader::ApplyEnvironment(config);
  unsetenv("STATESHIFT_DB_BACKEND");
  unsetenv("STATESHIFT_DB_CONNECTION_STRING");
  unsetenv("STATESHIFT_DB_POOL_SIZE");

  assert(config.database().backend() == "json");
  assert(config.database().connection_string() == "/tmp/env.json");
  assert(config.database().pool_size() == 12);
  assert(config.database().cache_size() == 100);
}

void TestNonNumericEnvironmentOverrideIsRejected() {
  auto config = ConfigLoader::Defaults();

  setenv("STATESHIFT_DB_CACHE_SIZE", "lots", 1);
  bool threw = false;
  try {
    ConfigLoader::ApplyEnvironment(config);
  } catch (const ConfigurationError&) {
    threw = true;
  }
  unsetenv("STATESHIFT_DB_CACHE_SIZE");

  assert(threw);
  assert(config.database().cache_size() == 100);
}

void TestValidateRejectsUnsupportedBackend() {
  auto config = ConfigLoader::Defaults();
  ConfigLoader::Validate(config);

  config.mutable_database()->set_backend("mongodb");
  bool threw = false;
  try {
    ConfigLoader::Validate(config);
  } catch (const ConfigurationError& e) {
    threw = std::string(e.what()).find("mongodb") != std::string::npos;
  }
  assert(threw);
}

void TestValidateRejectsEmptyConnectionString() {
  auto config = ConfigLoader::Defaults();
  config.mutable_database()->clear_connection_string();

  bool threw = false;
  try {
    ConfigLoader::Validate(config);
  } catch (const ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestZeroBackupRetentionIsKept() {
  const auto yaml_path = WriteYaml("zero_retention",
                                   R"(database:
  backend: json
  connection_string: "/tmp/store.json"
  backup_retention: 0
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_backup_retention());
  assert(config.database().backup_retention() == 0);
}

void TestValidateBoundsTimeout() {
  auto config = ConfigLoader::Defaults();
  config.mutable_database()->set_timeout_seconds(86400);
  ConfigLoader::Validate(config);

  config.mutable_database()->set_timeout_seconds(3000000);
  bool threw = false;
  try {
    ConfigLoader::Validate(config);
  } catch (const ConfigurationError& e) {
    threw = std::string(e.what()).find("timeout_seconds") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestExplicitValuesOverrideDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsConfigurationError();
  TestEnvironmentOverridesFileValues();
  TestNonNumericEnvironmentOverrideIsRejected();
  TestValidateRejectsUnsupportedBackend();
  TestValidateRejectsEmptyConnectionString();
  TestZeroBackupRetentionIsKept();
  TestValidateBoundsTimeout();

  std::cout << "stateshift_unit_config_loader: pass\n";
  return 0;
}
