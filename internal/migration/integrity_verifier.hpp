#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "history_store.hpp"
#include "registry.hpp"

namespace stateshift::migration {

struct IntegrityIssue {
  std::int64_t version = 0;
  std::string  name;
  std::string  recorded_hash;
  std::string  current_hash; // empty for missing units
  std::string  message;
};

struct IntegrityReport {
  std::size_t                 checked = 0;
  std::vector<IntegrityIssue> mismatches;
  std::vector<IntegrityIssue> missing;

  // Missing units are warnings only.
  bool Ok() const {
    return mismatches.empty();
  }
};

/*
  Recomputes the content hash of every committed unit and compares it with
  the hash recorded in History. Reports, never corrects.
*/
class IntegrityVerifier {
 public:
  explicit IntegrityVerifier(const MigrationRegistry& registry) : registry_(registry) {
  }

  IntegrityReport Verify(const std::vector<MigrationRecord>& history) const;

 private:
  const MigrationRegistry& registry_;
};

} // namespace stateshift::migration
