#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/entity.hpp"

namespace ledgersync::db {

enum class SortKey : std::uint8_t {
  kNone,
  kCreatedAt,
  kUpdatedAt,
  kDeletedAt,
  kOccurrenceDate,
  kName,
};

/*
  Entity filter. Unset members do not constrain.

  Backends may push the indexed members (owner, kind, soft_deleted, statuses,
  references, deletion window, date) down into storage but must give the same
  answer as Matches().
*/
struct EntityQuery {
  ledgersync::model::EntityKind kind = ledgersync::model::EntityKind::kExpense;
  std::string                   owner_id;

  std::optional<bool>                         soft_deleted;
  std::vector<ledgersync::model::SyncStatus>  statuses;
  std::optional<std::string>                  category_id;
  std::optional<std::string>                  recurring_rule_id;
  std::optional<uint64_t>                     deleted_before_ms; // deleted_at <  x
  std::optional<uint64_t>                     deleted_after_ms;  // deleted_at >  x
  std::optional<util::Date>                   occurrence_date;

  std::function<bool(const ledgersync::model::Entity&)> predicate;

  SortKey               sort       = SortKey::kNone;
  bool                  descending = false;
  std::optional<size_t> limit;
};

EntityQuery ActiveOf(ledgersync::model::EntityKind kind, const std::string& owner_id);
EntityQuery TombstonesOf(ledgersync::model::EntityKind kind, const std::string& owner_id);

bool Matches(const EntityQuery& query, const ledgersync::model::Entity& entity);

// Sort and truncate per query.sort / query.limit. Ties break on id.
void Finalize(const EntityQuery& query, std::vector<ledgersync::model::Entity>& entities);

} // namespace ledgersync::db
