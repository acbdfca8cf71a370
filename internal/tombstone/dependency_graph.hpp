#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/query.hpp"
#include "internal/model/entity_kind.hpp"

namespace ledgersync::tombstone {

enum class Reference : std::uint8_t {
  kCategory,      // categoryId
  kRecurringRule, // recurringExpenseId / recurringIncomeId
};

struct DependencyEdge {
  ledgersync::model::EntityKind dependent;
  Reference                     via;
};

/*
  Who may reference an entity of `parent` kind:

    Category         <- Expense, Budget, RecurringExpense (categoryId)
    RecurringExpense <- Expense (recurringExpenseId)
    RecurringIncome  <- Income  (recurringIncomeId)
*/
const std::vector<DependencyEdge>& DependentsOf(ledgersync::model::EntityKind parent);

// Active (not soft-deleted) dependents along one edge.
db::EntityQuery ActiveDependents(const DependencyEdge& edge, const std::string& owner_id, const std::string& parent_id);

// Kind the given reference of `dependent` points at.
ledgersync::model::EntityKind ReferencedKind(ledgersync::model::EntityKind dependent, Reference via);

} // namespace ledgersync::tombstone
