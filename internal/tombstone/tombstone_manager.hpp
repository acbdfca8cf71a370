#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/entity.hpp"
#include "internal/store/entity_store.hpp"
#include "internal/tombstone/retention_policy.hpp"

namespace ledgersync::tombstone {

enum class DependencyPolicy : std::uint8_t {
  kRefuse,           // DependencyExists while active dependents remain
  kDetachDependents, // reassign dependents to uncategorized / detach from the rule
};

struct DependencyCounts {
  std::map<ledgersync::model::EntityKind, std::size_t> by_kind;

  std::size_t Total() const;
  bool        Empty() const {
    return Total() == 0;
  }
};

struct SweepFailure {
  ledgersync::model::EntityKind kind;
  std::string                   id;
  std::string                   reason;
};

struct SweepReport {
  std::size_t               purged = 0;
  std::vector<SweepFailure> failures;
};

struct KindStatistics {
  std::size_t active       = 0;
  std::size_t deleted      = 0;
  std::size_t pending_sync = 0;
};

struct Statistics {
  std::map<ledgersync::model::EntityKind, KindStatistics> by_kind;
};

struct IntegrityIssue {
  ledgersync::model::EntityKind kind;
  std::string                   id;
  std::string                   problem;
};

/*
  Soft delete, restore, guarded hard delete and retention sweep.

  Validation failures (NotDeleted, NameConflict, DependencyExists) are thrown
  before anything is written. Each operation runs in one owner-serialized
  store transaction, so a dependency check and the delete it guards are
  atomic.
*/
class TombstoneManager {
 public:
  explicit TombstoneManager(std::shared_ptr<store::EntityStore> store);

  // Idempotent: an already deleted entity is returned unchanged.
  ledgersync::model::Entity SoftDelete(const std::string& owner_id, ledgersync::model::EntityKind kind, const std::string& id,
                                       const std::string& actor_id);

  // NotDeleted / NameConflict. References to hard-deleted parents are cleared.
  ledgersync::model::Entity Restore(const std::string& owner_id, ledgersync::model::EntityKind kind, const std::string& id);

  DependencyCounts Dependencies(const std::string& owner_id, ledgersync::model::EntityKind kind, const std::string& id);

  void HardDelete(const std::string& owner_id, ledgersync::model::EntityKind kind, const std::string& id,
                  DependencyPolicy policy = DependencyPolicy::kRefuse);

  // Purges tombstones with deletedAt < now - older_than (every kind).
  SweepReport SweepExpiredTombstones(const std::string& owner_id, std::chrono::milliseconds older_than);
  SweepReport Sweep(const std::string& owner_id, const RetentionPolicy& policy);

  // Newest deletion first. `kind` unset means every kind.
  std::vector<ledgersync::model::Entity> FetchTombstones(const std::string& owner_id, std::optional<ledgersync::model::EntityKind> kind = std::nullopt,
                                                         std::optional<uint64_t> newer_than_ms = std::nullopt);
  std::vector<ledgersync::model::Entity> FetchRecentlyDeleted(const std::string& owner_id, std::chrono::milliseconds within);

  Statistics                  Stats(const std::string& owner_id);
  std::vector<IntegrityIssue> ValidateIntegrity(const std::string& owner_id);

 private:
  SweepReport SweepWith(const std::string& owner_id, const std::function<std::chrono::milliseconds(ledgersync::model::EntityKind)>& retention);

  std::shared_ptr<store::EntityStore> store_;
};

} // namespace ledgersync::tombstone
