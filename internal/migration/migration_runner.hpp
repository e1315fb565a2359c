#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "history_store.hpp"
#include "migration.hpp"
#include "registry.hpp"

namespace stateshift::migration {

enum class MigrationState {
  kPending,
  kValidating,
  kApplying,
  kCommitted,
  kFailed,
};

const char* ToString(MigrationState state);

struct MigrationStatus {
  std::int64_t   version = 0;
  std::string    name;
  MigrationState state = MigrationState::kPending;
  std::string    error;
};

struct RollbackSafety {
  std::int64_t        version = 0;
  std::string         name;
  bool                safe = false;
  std::optional<bool> data_destructive; // unknown when the unit is missing
  std::string         warning;
};

struct RunnerHooks {
  // Called before a unit marked risky is applied. A throw aborts the batch.
  std::function<void(const MigrationUnit&)> before_risky_apply;

  // Called once a rollback plan is validated, before the first revert.
  std::function<void()> before_rollback;
};

/*
  MigrationRunner

  Apply pipeline, per unit:

    PENDING -> VALIDATING -> APPLYING -> COMMITTED
                          \-> FAILED (transaction rolled back)

  Every dependency of every pending unit is checked before anything is
  written; one unmet dependency aborts the whole batch. Each unit then runs
  in its own backend transaction together with its History and
  SchemaVersion update. The first failure halts the batch.

  Overlapping calls on the same instance are rejected with
  util::MigrationInProgressError; separate instances do not see each other.
*/
class MigrationRunner {
 public:
  // Holds the instance's in-progress flag for its lifetime.
  class InProgressGuard {
   public:
    InProgressGuard(std::atomic<bool>& flag, const char* operation);
    ~InProgressGuard();

    InProgressGuard(const InProgressGuard&)            = delete;
    InProgressGuard& operator=(const InProgressGuard&) = delete;

   private:
    std::atomic<bool>& flag_;
  };

  MigrationRunner(db::Backend& backend, const MigrationRegistry& registry, RuntimeConfig config, RunnerHooks hooks = {});

  // Units with a version above the current SchemaVersion, ascending.
  std::vector<MigrationRegistry::UnitPtr> PendingMigrations() const;

  // Returns the number of units committed. Throws util::MigrationError
  // (util::DependencyError for unmet dependencies) naming the failing unit.
  std::size_t Run();

  // Reverts the newest `steps` committed units, newest first.
  std::size_t RollbackSteps(std::size_t steps);

  // Reverts every committed unit newer than `target` (0 reverts all).
  std::size_t RollbackToVersion(std::int64_t target);

  RollbackSafety CheckRollbackSafety(std::int64_t version) const;

  // Per-unit states of the most recent Run().
  std::vector<MigrationStatus> LastBatch() const;

  bool InProgress() const {
    return in_progress_.load();
  }

  // Excludes Run() and the rollbacks until the guard is released. Throws
  // util::MigrationInProgressError when one of them is already running.
  InProgressGuard Exclusive(const char* operation) {
    return InProgressGuard(in_progress_, operation);
  }

 private:
  void ApplyOne(const MigrationUnit& unit, MigrationStatus& status);
  void RevertPlan(const std::vector<MigrationRecord>& plan);
  void SetStatus(MigrationStatus& status, MigrationState state, const std::string& error = "");

  db::Backend&             backend_;
  const MigrationRegistry& registry_;
  RuntimeConfig            config_;
  RunnerHooks              hooks_;
  HistoryStore             history_;

  std::atomic<bool>            in_progress_{false};
  mutable std::mutex           batch_mutex_;
  std::vector<MigrationStatus> last_batch_;
};

} // namespace stateshift::migration
