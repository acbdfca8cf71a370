#include "query.hpp"

#include <algorithm>

namespace ledgersync::db {

using ledgersync::model::Entity;

EntityQuery ActiveOf(ledgersync::model::EntityKind kind, const std::string& owner_id) {
  EntityQuery query;
  query.kind         = kind;
  query.owner_id     = owner_id;
  query.soft_deleted = false;
  return query;
}

EntityQuery TombstonesOf(ledgersync::model::EntityKind kind, const std::string& owner_id) {
  EntityQuery query;
  query.kind         = kind;
  query.owner_id     = owner_id;
  query.soft_deleted = true;
  return query;
}

bool Matches(const EntityQuery& query, const Entity& entity) {
  if (entity.kind != query.kind || entity.owner_id != query.owner_id) {
    return false;
  }
  if (query.soft_deleted.has_value() && entity.sync.soft_deleted != *query.soft_deleted) {
    return false;
  }
  if (!query.statuses.empty() && std::find(query.statuses.begin(), query.statuses.end(), entity.sync.status) == query.statuses.end()) {
    return false;
  }
  if (query.category_id.has_value() && ledgersync::model::CategoryRef(entity.fields) != query.category_id) {
    return false;
  }
  if (query.recurring_rule_id.has_value() && ledgersync::model::RuleRef(entity.fields) != query.recurring_rule_id) {
    return false;
  }
  if (query.deleted_before_ms.has_value() && !(entity.sync.deleted_at_ms && *entity.sync.deleted_at_ms < *query.deleted_before_ms)) {
    return false;
  }
  if (query.deleted_after_ms.has_value() && !(entity.sync.deleted_at_ms && *entity.sync.deleted_at_ms > *query.deleted_after_ms)) {
    return false;
  }
  if (query.occurrence_date.has_value() && ledgersync::model::OccurrenceDate(entity.fields) != query.occurrence_date) {
    return false;
  }
  if (query.predicate && !query.predicate(entity)) {
    return false;
  }
  return true;
}

namespace {

bool Less(SortKey key, const Entity& a, const Entity& b) {
  switch (key) {
    case SortKey::kCreatedAt:
      return a.sync.created_at_ms < b.sync.created_at_ms;
    case SortKey::kUpdatedAt:
      return a.sync.updated_at_ms < b.sync.updated_at_ms;
    case SortKey::kDeletedAt:
      return a.sync.deleted_at_ms.value_or(0) < b.sync.deleted_at_ms.value_or(0);
    case SortKey::kOccurrenceDate: {
      const auto date_a = ledgersync::model::OccurrenceDate(a.fields);
      const auto date_b = ledgersync::model::OccurrenceDate(b.fields);
      return date_a.value_or(util::Date{}) < date_b.value_or(util::Date{});
    }
    case SortKey::kName:
      return ledgersync::model::DisplayName(a) < ledgersync::model::DisplayName(b);
    case SortKey::kNone:
      break;
  }
  return false;
}

} // namespace

void Finalize(const EntityQuery& query, std::vector<Entity>& entities) {
  if (query.sort != SortKey::kNone) {
    std::stable_sort(entities.begin(), entities.end(), [&](const Entity& a, const Entity& b) {
      if (Less(query.sort, a, b)) return !query.descending;
      if (Less(query.sort, b, a)) return query.descending;
      return a.id < b.id;
    });
  } else {
    std::sort(entities.begin(), entities.end(), [](const Entity& a, const Entity& b) { return a.id < b.id; });
  }
  if (query.limit.has_value() && entities.size() > *query.limit) {
    entities.resize(*query.limit);
  }
}

} // namespace ledgersync::db
