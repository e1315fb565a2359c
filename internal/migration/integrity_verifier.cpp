#include "integrity_verifier.hpp"

#include "internal/observability/logging.hpp"

namespace stateshift::migration {

using observability::IntField;
using observability::StringField;

IntegrityReport IntegrityVerifier::Verify(const std::vector<MigrationRecord>& history) const {
  IntegrityReport report;

  for (const auto& record : history) {
    ++report.checked;

    IntegrityIssue issue;
    issue.version       = record.version;
    issue.name          = record.name;
    issue.recorded_hash = record.file_hash;

    const auto unit = registry_.Find(record.version);
    if (!unit) {
      issue.message = "Migration file not found for " + record.name;
      STATESHIFT_LOG_WARN("Applied migration is missing", {IntField("version", record.version), StringField("name", record.name)});
      report.missing.push_back(std::move(issue));
      continue;
    }

    try {
      issue.current_hash = unit->ContentHash();
    } catch (const std::exception& e) {
      issue.message = "Migration source unreadable: " + std::string(e.what());
      STATESHIFT_LOG_WARN("Applied migration is missing", {IntField("version", record.version), StringField("error", e.what())});
      report.missing.push_back(std::move(issue));
      continue;
    }

    if (issue.current_hash != record.file_hash) {
      issue.message = "Migration " + record.name + " changed after it was applied";
      STATESHIFT_LOG_WARN("Migration hash mismatch",
                          {IntField("version", record.version), StringField("recorded", record.file_hash), StringField("current", issue.current_hash)});
      report.mismatches.push_back(std::move(issue));
    }
  }

  return report;
}

} // namespace stateshift::migration
