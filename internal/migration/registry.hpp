#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "migration.hpp"

namespace stateshift::migration {

/*
  MigrationRegistry

  version -> unit table. Units come from explicit registration in code or
  from YAML files in a migrations directory; nothing is executed while
  loading.

  Every conflict is raised here, at registration time:
    - duplicate versions
    - a unit depending on a version >= its own
*/
class MigrationRegistry {
 public:
  using UnitPtr = std::shared_ptr<const MigrationUnit>;

  struct ParsedFileName {
    std::int64_t version;
    std::string  name;
  };

  // Throws util::MigrationError.
  void Register(UnitPtr unit);
  void Register(MigrationDefinition definition);

  // Loads every *.yaml / *.yml file; invalid file names are logged and
  // skipped. A missing directory loads nothing. Returns the number loaded.
  std::size_t LoadDirectory(const std::filesystem::path& dir);

  // Drops every unit LoadDirectory() added; code-registered units stay.
  void ClearLoaded();

  // Ascending by version.
  std::vector<UnitPtr> Ordered() const;

  UnitPtr Find(std::int64_t version) const;

  std::size_t Size() const {
    return units_.size();
  }

  // YYYYMMDDHHMMSS_name, YYYYMMDD_HHMMSS_name or <digits>_name.
  static std::optional<ParsedFileName> ParseFileName(const std::string& stem);

  // Writes a timestamp-versioned YAML template and returns its path.
  static std::filesystem::path CreateMigrationFile(const std::filesystem::path& dir,
                                                   const std::string&           name,
                                                   const std::string&           description,
                                                   util::TimePoint              now = util::Now());

 private:
  std::map<std::int64_t, UnitPtr> units_;
  std::set<std::int64_t>          loaded_;
};

} // namespace stateshift::migration
