#include "dependency_graph.hpp"

namespace ledgersync::tombstone {

using ledgersync::model::EntityKind;

const std::vector<DependencyEdge>& DependentsOf(EntityKind parent) {
  static const std::vector<DependencyEdge> kCategoryDependents = {
      {EntityKind::kExpense, Reference::kCategory},
      {EntityKind::kBudget, Reference::kCategory},
      {EntityKind::kRecurringExpense, Reference::kCategory},
  };
  static const std::vector<DependencyEdge> kRecurringExpenseDependents = {{EntityKind::kExpense, Reference::kRecurringRule}};
  static const std::vector<DependencyEdge> kRecurringIncomeDependents  = {{EntityKind::kIncome, Reference::kRecurringRule}};
  static const std::vector<DependencyEdge> kNone;

  switch (parent) {
    case EntityKind::kCategory:
      return kCategoryDependents;
    case EntityKind::kRecurringExpense:
      return kRecurringExpenseDependents;
    case EntityKind::kRecurringIncome:
      return kRecurringIncomeDependents;
    default:
      return kNone;
  }
}

db::EntityQuery ActiveDependents(const DependencyEdge& edge, const std::string& owner_id, const std::string& parent_id) {
  auto query = db::ActiveOf(edge.dependent, owner_id);
  if (edge.via == Reference::kCategory) {
    query.category_id = parent_id;
  } else {
    query.recurring_rule_id = parent_id;
  }
  return query;
}

EntityKind ReferencedKind(EntityKind dependent, Reference via) {
  if (via == Reference::kCategory) {
    return EntityKind::kCategory;
  }
  return dependent == EntityKind::kIncome ? EntityKind::kRecurringIncome : EntityKind::kRecurringExpense;
}

} // namespace ledgersync::tombstone
