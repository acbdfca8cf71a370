#include "entity_kind.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace ledgersync::model {

std::string_view CollectionName(EntityKind kind) {
  switch (kind) {
    case EntityKind::kCategory:
      return "categories";
    case EntityKind::kBudget:
      return "budgets";
    case EntityKind::kIncome:
      return "incomes";
    case EntityKind::kRecurringExpense:
      return "recurringExpenses";
    case EntityKind::kRecurringIncome:
      return "recurringIncomes";
    case EntityKind::kExpense:
      return "expenses";
  }
  return "unknown";
}

std::string_view KindName(EntityKind kind) {
  switch (kind) {
    case EntityKind::kCategory:
      return "category";
    case EntityKind::kBudget:
      return "budget";
    case EntityKind::kIncome:
      return "income";
    case EntityKind::kRecurringExpense:
      return "recurring-expense";
    case EntityKind::kRecurringIncome:
      return "recurring-income";
    case EntityKind::kExpense:
      return "expense";
  }
  return "unknown";
}

EntityKind ParseEntityKind(std::string_view text) {
  for (const auto kind : kDependencyOrder) {
    if (text == CollectionName(kind) || text == KindName(kind)) {
      return kind;
    }
  }
  throw util::InvalidValue("unrecognized entity kind '" + std::string(text) + "'");
}

} // namespace ledgersync::model
