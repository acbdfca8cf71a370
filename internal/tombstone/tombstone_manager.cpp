#include "tombstone_manager.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/tombstone/dependency_graph.hpp"
#include "internal/util/errors.hpp"

namespace ledgersync::tombstone {

using ledgersync::model::Entity;
using ledgersync::model::EntityKind;
using observability::IntField;
using observability::StringField;
using store::EntityStore;

namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

DependencyCounts CountDependents(EntityStore::Batch& batch, EntityKind kind, const std::string& id) {
  DependencyCounts counts;
  for (const auto& edge : DependentsOf(kind)) {
    const auto n = batch.Count(ActiveDependents(edge, batch.owner_id(), id));
    if (n > 0) {
      counts.by_kind[edge.dependent] += n;
    }
  }
  return counts;
}

std::string Describe(EntityKind kind, const std::string& id) {
  return std::string(ledgersync::model::KindName(kind)) + " " + id;
}

} // namespace

std::size_t DependencyCounts::Total() const {
  std::size_t total = 0;
  for (const auto& [_, n] : by_kind) total += n;
  return total;
}

TombstoneManager::TombstoneManager(std::shared_ptr<store::EntityStore> store) : store_(std::move(store)) {
}

Entity TombstoneManager::SoftDelete(const std::string& owner_id, EntityKind kind, const std::string& id, const std::string& actor_id) {
  Entity deleted;
  store_->Run(owner_id, [&](EntityStore::Batch& batch) { deleted = batch.Tombstone(kind, id, actor_id); });
  LEDGERSYNC_LOG_INFO("entity soft-deleted", {StringField("kind", ledgersync::model::KindName(kind)), StringField("id", id),
                                              StringField("by", actor_id)});
  return deleted;
}

Entity TombstoneManager::Restore(const std::string& owner_id, EntityKind kind, const std::string& id) {
  Entity restored;
  store_->Run(owner_id, [&](EntityStore::Batch& batch) {
    const auto entity = batch.Get(kind, id);
    if (!entity.sync.soft_deleted) {
      throw util::NotDeleted("restore " + Describe(kind, id) + ": entity is not deleted");
    }

    if (kind == EntityKind::kCategory) {
      const auto name  = Lower(entity.As<ledgersync::model::CategoryFields>().name);
      auto       query = db::ActiveOf(EntityKind::kCategory, owner_id);
      query.predicate  = [&](const Entity& other) {
        return other.id != id && Lower(other.As<ledgersync::model::CategoryFields>().name) == name;
      };
      if (batch.Count(query) > 0) {
        throw util::NameConflict("restore " + Describe(kind, id) + ": an active category named '" +
                                 entity.As<ledgersync::model::CategoryFields>().name + "' already exists");
      }
    }

    const auto category = ledgersync::model::CategoryRef(entity.fields);
    const bool drop_category = category.has_value() && !batch.Find(EntityKind::kCategory, *category).has_value();

    const auto rule      = ledgersync::model::RuleRef(entity.fields);
    const bool drop_rule = rule.has_value() && !batch.Find(ReferencedKind(kind, Reference::kRecurringRule), *rule).has_value();

    restored = batch.Untombstone(kind, id, [&](ledgersync::model::EntityFields& fields) {
      if (drop_category) ledgersync::model::ClearCategoryRef(fields);
      if (drop_rule) ledgersync::model::ClearRuleRef(fields);
    });
  });

  LEDGERSYNC_LOG_INFO("entity restored", {StringField("kind", ledgersync::model::KindName(kind)), StringField("id", id)});
  return restored;
}

DependencyCounts TombstoneManager::Dependencies(const std::string& owner_id, EntityKind kind, const std::string& id) {
  DependencyCounts counts;
  store_->Read(owner_id, [&](EntityStore::Batch& batch) { counts = CountDependents(batch, kind, id); });
  return counts;
}

void TombstoneManager::HardDelete(const std::string& owner_id, EntityKind kind, const std::string& id, DependencyPolicy policy) {
  std::size_t detached = 0;
  store_->Run(owner_id, [&](EntityStore::Batch& batch) {
    batch.Get(kind, id);

    const auto counts = CountDependents(batch, kind, id);
    if (!counts.Empty()) {
      if (policy == DependencyPolicy::kRefuse) {
        util::DependencyExists::Dependents dependents;
        for (const auto& [dependent_kind, n] : counts.by_kind) {
          dependents.emplace_back(std::string(ledgersync::model::CollectionName(dependent_kind)), n);
        }
        throw util::DependencyExists("hard delete " + Describe(kind, id) + ": " + std::to_string(counts.Total()) + " active dependents",
                                     std::move(dependents));
      }

      for (const auto& edge : DependentsOf(kind)) {
        for (const auto& dependent : batch.Query(ActiveDependents(edge, owner_id, id))) {
          batch.Mutate(dependent.kind, dependent.id, [&](ledgersync::model::EntityFields& fields) {
            if (edge.via == Reference::kCategory) {
              ledgersync::model::ClearCategoryRef(fields);
            } else {
              ledgersync::model::ClearRuleRef(fields);
            }
          });
          ++detached;
        }
      }
    }

    batch.Erase(kind, id);
  });

  LEDGERSYNC_LOG_INFO("entity hard-deleted", {StringField("kind", ledgersync::model::KindName(kind)), StringField("id", id),
                                              IntField("detached_dependents", static_cast<int64_t>(detached))});
}

SweepReport TombstoneManager::SweepExpiredTombstones(const std::string& owner_id, std::chrono::milliseconds older_than) {
  return SweepWith(owner_id, [&](EntityKind) { return older_than; });
}

SweepReport TombstoneManager::Sweep(const std::string& owner_id, const RetentionPolicy& policy) {
  return SweepWith(owner_id, [&](EntityKind kind) { return policy.For(kind); });
}

SweepReport TombstoneManager::SweepWith(const std::string& owner_id, const std::function<std::chrono::milliseconds(EntityKind)>& retention) {
  SweepReport report;
  const auto  now_ms = store_->NowMs();

  // dependents first so a parent whose children expire together can go too
  for (auto it = ledgersync::model::kDependencyOrder.rbegin(); it != ledgersync::model::kDependencyOrder.rend(); ++it) {
    const auto kind      = *it;
    const auto window_ms = static_cast<uint64_t>(retention(kind).count());
    if (window_ms > now_ms) {
      continue;
    }

    auto query              = db::TombstonesOf(kind, owner_id);
    query.deleted_before_ms = now_ms - window_ms;

    for (const auto& tombstone : store_->Query(query)) {
      try {
        HardDelete(owner_id, kind, tombstone.id, DependencyPolicy::kRefuse);
        ++report.purged;
      } catch (const util::NotFound&) {
        // purged concurrently
      } catch (const util::DependencyExists& e) {
        report.failures.push_back({kind, tombstone.id, e.what()});
      } catch (const std::exception& e) {
        LEDGERSYNC_LOG_ERROR("tombstone purge failed", {StringField("kind", ledgersync::model::KindName(kind)), StringField("id", tombstone.id),
                                                        StringField("error", e.what())});
        report.failures.push_back({kind, tombstone.id, e.what()});
      }
    }
  }

  LEDGERSYNC_LOG_INFO("tombstone sweep finished", {StringField("owner", owner_id), IntField("purged", static_cast<int64_t>(report.purged)),
                                                   IntField("skipped", static_cast<int64_t>(report.failures.size()))});
  return report;
}

std::vector<Entity> TombstoneManager::FetchTombstones(const std::string& owner_id, std::optional<EntityKind> kind,
                                                      std::optional<uint64_t> newer_than_ms) {
  std::vector<Entity> out;
  store_->Read(owner_id, [&](EntityStore::Batch& batch) {
    for (const auto candidate : ledgersync::model::kDependencyOrder) {
      if (kind.has_value() && *kind != candidate) continue;
      auto query             = db::TombstonesOf(candidate, owner_id);
      query.deleted_after_ms = newer_than_ms;
      auto found             = batch.Query(query);
      out.insert(out.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    }
  });

  std::stable_sort(out.begin(), out.end(), [](const Entity& a, const Entity& b) {
    return a.sync.deleted_at_ms.value_or(0) > b.sync.deleted_at_ms.value_or(0);
  });
  return out;
}

std::vector<Entity> TombstoneManager::FetchRecentlyDeleted(const std::string& owner_id, std::chrono::milliseconds within) {
  const auto now_ms    = store_->NowMs();
  const auto window_ms = static_cast<uint64_t>(within.count());
  return FetchTombstones(owner_id, std::nullopt, window_ms < now_ms ? now_ms - window_ms : 0);
}

Statistics TombstoneManager::Stats(const std::string& owner_id) {
  Statistics stats;
  store_->Read(owner_id, [&](EntityStore::Batch& batch) {
    for (const auto kind : ledgersync::model::kDependencyOrder) {
      auto& entry   = stats.by_kind[kind];
      entry.active  = batch.Count(db::ActiveOf(kind, owner_id));
      entry.deleted = batch.Count(db::TombstonesOf(kind, owner_id));

      db::EntityQuery pending;
      pending.kind     = kind;
      pending.owner_id = owner_id;
      pending.statuses = {ledgersync::model::SyncStatus::kCreated, ledgersync::model::SyncStatus::kUpdated, ledgersync::model::SyncStatus::kDeleted};
      entry.pending_sync = batch.Count(pending);
    }
  });
  return stats;
}

std::vector<IntegrityIssue> TombstoneManager::ValidateIntegrity(const std::string& owner_id) {
  std::vector<IntegrityIssue> issues;
  store_->Read(owner_id, [&](EntityStore::Batch& batch) {
    for (const auto kind : ledgersync::model::kDependencyOrder) {
      db::EntityQuery all;
      all.kind     = kind;
      all.owner_id = owner_id;
      for (const auto& entity : batch.Query(all)) {
        for (auto& problem : ledgersync::model::InvariantViolations(entity)) {
          issues.push_back({kind, entity.id, std::move(problem)});
        }
        if (entity.sync.soft_deleted) {
          continue;
        }
        if (auto category = ledgersync::model::CategoryRef(entity.fields); category && !batch.Find(EntityKind::kCategory, *category)) {
          issues.push_back({kind, entity.id, "dangling category reference " + *category});
        }
        if (auto rule = ledgersync::model::RuleRef(entity.fields); rule && !batch.Find(ReferencedKind(kind, Reference::kRecurringRule), *rule)) {
          issues.push_back({kind, entity.id, "dangling recurring rule reference " + *rule});
        }
      }
    }
  });
  return issues;
}

} // namespace ledgersync::tombstone
