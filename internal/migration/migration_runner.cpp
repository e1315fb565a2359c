#include "migration_runner.hpp"

#include <algorithm>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace stateshift::migration {

using observability::IntField;
using observability::StringField;
using util::DependencyError;
using util::MigrationError;

const char* ToString(MigrationState state) {
  switch (state) {
    case MigrationState::kPending:
      return "PENDING";
    case MigrationState::kValidating:
      return "VALIDATING";
    case MigrationState::kApplying:
      return "APPLYING";
    case MigrationState::kCommitted:
      return "COMMITTED";
    case MigrationState::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

MigrationRunner::InProgressGuard::InProgressGuard(std::atomic<bool>& flag, const char* operation) : flag_(flag) {
  if (flag_.exchange(true)) {
    STATESHIFT_LOG_WARN("Migration operation already in progress", {StringField("operation", operation)});
    throw util::MigrationInProgressError(std::string("Migration operation already in progress, rejected ") + operation);
  }
}

MigrationRunner::InProgressGuard::~InProgressGuard() {
  flag_.store(false);
}

MigrationRunner::MigrationRunner(db::Backend& backend, const MigrationRegistry& registry, RuntimeConfig config, RunnerHooks hooks)
    : backend_(backend), registry_(registry), config_(std::move(config)), hooks_(std::move(hooks)), history_(backend) {
}

std::vector<MigrationRegistry::UnitPtr> MigrationRunner::PendingMigrations() const {
  const auto current = history_.SchemaVersion();

  std::vector<MigrationRegistry::UnitPtr> pending;
  for (auto& unit : registry_.Ordered()) {
    if (unit->Version() > current) {
      pending.push_back(std::move(unit));
    }
  }
  return pending;
}

// ------------------------------------------------------------------
// Apply
// ------------------------------------------------------------------

std::size_t MigrationRunner::Run() {
  InProgressGuard guard(in_progress_, "run");

  const auto pending = PendingMigrations();

  std::vector<MigrationStatus> batch;
  batch.reserve(pending.size());
  for (const auto& unit : pending) {
    batch.push_back(MigrationStatus{unit->Version(), unit->Name(), MigrationState::kPending, ""});
  }
  {
    std::scoped_lock lock(batch_mutex_);
    last_batch_ = batch;
  }

  if (pending.empty()) {
    STATESHIFT_LOG_INFO("No pending migrations");
    return 0;
  }

  // Whole-batch dependency check: a dependency is satisfied by committed
  // History or by an earlier unit of this same batch.
  std::set<std::int64_t> available;
  for (const auto& record : history_.History()) {
    available.insert(record.version);
  }

  for (std::size_t i = 0; i < pending.size(); ++i) {
    const auto& unit = *pending[i];
    for (const auto dep : unit.Metadata().dependencies) {
      if (!available.contains(dep)) {
        const auto message = "Migration " + unit.Name() + " has unmet dependency: version " + std::to_string(dep) + " must be applied first";
        {
          std::scoped_lock lock(batch_mutex_);
          last_batch_[i].state = MigrationState::kFailed;
          last_batch_[i].error = message;
        }
        STATESHIFT_LOG_ERROR("Migration batch aborted", {IntField("version", unit.Version()), StringField("error", message)});
        throw DependencyError(unit.Version(), unit.Name(), message);
      }
    }
    available.insert(unit.Version());
  }

  STATESHIFT_LOG_INFO("Running pending migrations", {IntField("count", static_cast<std::int64_t>(pending.size()))});

  for (std::size_t i = 0; i < pending.size(); ++i) {
    MigrationStatus status;
    {
      std::scoped_lock lock(batch_mutex_);
      status = last_batch_[i];
    }
    ApplyOne(*pending[i], status);
  }

  return pending.size();
}

void MigrationRunner::ApplyOne(const MigrationUnit& unit, MigrationStatus& status) {
  const auto& meta = unit.Metadata();

  try {
    SetStatus(status, MigrationState::kValidating);

    std::set<std::int64_t> committed;
    for (const auto& record : history_.History()) {
      committed.insert(record.version);
    }
    for (const auto dep : meta.dependencies) {
      if (!committed.contains(dep)) {
        throw DependencyError(meta.version, meta.name,
                              "Migration " + meta.name + " has unmet dependency: version " + std::to_string(dep) + " must be applied first");
      }
    }

    MigrationRecord record;
    record.version      = meta.version;
    record.name         = meta.name;
    record.description  = meta.description;
    record.dependencies = meta.dependencies;
    record.file_hash    = unit.ContentHash();

    if (meta.risky && hooks_.before_risky_apply) {
      STATESHIFT_LOG_WARN("Creating backup before risky migration", {StringField("name", meta.name)});
      hooks_.before_risky_apply(unit);
    }

    SetStatus(status, MigrationState::kApplying);
    STATESHIFT_LOG_INFO("Applying migration", {IntField("version", meta.version), StringField("name", meta.name)});

    db::RunInTransaction(backend_, [&] {
      unit.Apply(backend_, config_);
      record.applied_at = util::ToIso8601(util::Now());
      history_.RecordApplied(record);
    });
  } catch (const MigrationError& e) {
    SetStatus(status, MigrationState::kFailed, e.what());
    STATESHIFT_LOG_ERROR("Migration failed and was rolled back", {IntField("version", meta.version), StringField("name", meta.name), StringField("error", e.what())});
    if (e.version() == meta.version) throw;
    throw MigrationError(meta.version, meta.name, "Migration " + meta.name + " failed: " + e.what());
  } catch (const std::exception& e) {
    SetStatus(status, MigrationState::kFailed, e.what());
    STATESHIFT_LOG_ERROR("Migration failed and was rolled back", {IntField("version", meta.version), StringField("name", meta.name), StringField("error", e.what())});
    throw MigrationError(meta.version, meta.name, "Migration " + meta.name + " failed: " + e.what());
  }

  SetStatus(status, MigrationState::kCommitted);
  STATESHIFT_LOG_INFO("Migration applied", {IntField("version", meta.version), StringField("name", meta.name)});
}

void MigrationRunner::SetStatus(MigrationStatus& status, MigrationState state, const std::string& error) {
  status.state = state;
  status.error = error;

  std::scoped_lock lock(batch_mutex_);
  for (auto& entry : last_batch_) {
    if (entry.version == status.version) {
      entry = status;
      break;
    }
  }
}

std::vector<MigrationStatus> MigrationRunner::LastBatch() const {
  std::scoped_lock lock(batch_mutex_);
  return last_batch_;
}

// ------------------------------------------------------------------
// Rollback
// ------------------------------------------------------------------

std::size_t MigrationRunner::RollbackSteps(std::size_t steps) {
  InProgressGuard guard(in_progress_, "rollback");

  if (steps == 0) return 0;

  const auto history = history_.History();
  if (history.empty()) {
    throw MigrationError("No migrations to rollback");
  }
  if (steps > history.size()) {
    throw MigrationError("Cannot rollback " + std::to_string(steps) + " migrations, only " + std::to_string(history.size()) + " applied");
  }

  std::vector<MigrationRecord> plan(history.end() - static_cast<std::ptrdiff_t>(steps), history.end());
  std::reverse(plan.begin(), plan.end());

  STATESHIFT_LOG_INFO("Rolling back migrations", {IntField("count", static_cast<std::int64_t>(steps))});
  RevertPlan(plan);
  return plan.size();
}

std::size_t MigrationRunner::RollbackToVersion(std::int64_t target) {
  InProgressGuard guard(in_progress_, "rollback");

  const auto current = history_.SchemaVersion();
  if (target == current) {
    STATESHIFT_LOG_INFO("Already at target version", {IntField("version", target)});
    return 0;
  }
  if (target > current || target < 0) {
    throw MigrationError("Invalid version: " + std::to_string(target) + " not found in migration history (current version: " + std::to_string(current) + ")");
  }

  const auto history = history_.History();
  if (target != 0) {
    const bool known = std::any_of(history.begin(), history.end(), [&](const MigrationRecord& r) { return r.version == target; });
    if (!known) {
      throw MigrationError("Invalid version: " + std::to_string(target) + " not found in migration history");
    }
  }

  std::vector<MigrationRecord> plan;
  for (auto it = history.rbegin(); it != history.rend() && it->version > target; ++it) {
    plan.push_back(*it);
  }

  STATESHIFT_LOG_INFO("Rolling back to version",
                      {IntField("from", current), IntField("to", target), IntField("count", static_cast<std::int64_t>(plan.size()))});
  RevertPlan(plan);
  return plan.size();
}

void MigrationRunner::RevertPlan(const std::vector<MigrationRecord>& plan) {
  if (plan.empty()) return;

  // Resolve every unit first so an unrevertable one fails before anything is touched.
  std::vector<MigrationRegistry::UnitPtr> units;
  units.reserve(plan.size());
  for (const auto& record : plan) {
    auto unit = registry_.Find(record.version);
    if (!unit) {
      throw MigrationError(record.version, record.name,
                           "Migration file not found for " + record.name + " (version " + std::to_string(record.version) + ")");
    }
    if (!unit->CanRevert()) {
      throw MigrationError(record.version, record.name, "Migration " + record.name + " has no revert operation; rollback is unsupported");
    }
    units.push_back(std::move(unit));
  }

  if (hooks_.before_rollback) {
    hooks_.before_rollback();
  }

  for (std::size_t i = 0; i < plan.size(); ++i) {
    const auto& record = plan[i];
    const auto& unit   = *units[i];

    try {
      if (unit.ContentHash() != record.file_hash) {
        STATESHIFT_LOG_WARN("Migration hash mismatch, source changed since it was applied", {IntField("version", record.version), StringField("name", record.name)});
      }

      STATESHIFT_LOG_INFO("Rolling back migration", {IntField("version", record.version), StringField("name", record.name)});
      db::RunInTransaction(backend_, [&] {
        unit.Revert(backend_, config_);
        history_.RemoveApplied(record.version, util::ToIso8601(util::Now()));
      });
    } catch (const std::exception& e) {
      STATESHIFT_LOG_ERROR("Rollback failed", {IntField("version", record.version), StringField("name", record.name), StringField("error", e.what())});
      throw MigrationError(record.version, record.name, "Rollback of " + record.name + " failed: " + e.what());
    }

    STATESHIFT_LOG_INFO("Migration rolled back", {IntField("version", record.version), StringField("name", record.name)});
  }
}

RollbackSafety MigrationRunner::CheckRollbackSafety(std::int64_t version) const {
  RollbackSafety result;
  result.version = version;

  const auto unit = registry_.Find(version);
  if (!unit) {
    result.warning = "Migration file not found for version " + std::to_string(version);
    return result;
  }

  const auto& meta        = unit->Metadata();
  result.name             = meta.name;
  result.data_destructive = meta.data_destructive;

  if (!unit->CanRevert()) {
    result.warning = "Migration " + meta.name + " has no revert operation";
    return result;
  }

  result.safe = !meta.data_destructive;
  if (meta.data_destructive) {
    result.warning = "Rolling back migration " + meta.name + " may result in data loss. Ensure you have a recent backup before proceeding.";
  }
  return result;
}

} // namespace stateshift::migration
