#include "entity.hpp"

#include <type_traits>

namespace ledgersync::model {

EntityFields DefaultFields(EntityKind kind) {
  switch (kind) {
    case EntityKind::kCategory:
      return CategoryFields{};
    case EntityKind::kBudget:
      return BudgetFields{};
    case EntityKind::kIncome:
      return IncomeFields{};
    case EntityKind::kExpense:
      return ExpenseFields{};
    case EntityKind::kRecurringExpense:
    case EntityKind::kRecurringIncome:
      return RecurringRuleFields{};
  }
  throw util::InvalidValue("unknown entity kind");
}

bool FieldsMatchKind(EntityKind kind, const EntityFields& fields) {
  switch (kind) {
    case EntityKind::kCategory:
      return std::holds_alternative<CategoryFields>(fields);
    case EntityKind::kBudget:
      return std::holds_alternative<BudgetFields>(fields);
    case EntityKind::kIncome:
      return std::holds_alternative<IncomeFields>(fields);
    case EntityKind::kExpense:
      return std::holds_alternative<ExpenseFields>(fields);
    case EntityKind::kRecurringExpense:
    case EntityKind::kRecurringIncome:
      return std::holds_alternative<RecurringRuleFields>(fields);
  }
  return false;
}

std::optional<std::string> CategoryRef(const EntityFields& fields) {
  return std::visit(
      [](const auto& f) -> std::optional<std::string> {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, ExpenseFields> || std::is_same_v<T, BudgetFields> || std::is_same_v<T, RecurringRuleFields>) {
          return f.category_id;
        } else {
          return std::nullopt;
        }
      },
      fields);
}

std::optional<std::string> RuleRef(const EntityFields& fields) {
  return std::visit(
      [](const auto& f) -> std::optional<std::string> {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, ExpenseFields> || std::is_same_v<T, IncomeFields>) {
          return f.recurring_rule_id;
        } else {
          return std::nullopt;
        }
      },
      fields);
}

void ClearCategoryRef(EntityFields& fields) {
  std::visit(
      [](auto& f) {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, ExpenseFields> || std::is_same_v<T, BudgetFields> || std::is_same_v<T, RecurringRuleFields>) {
          f.category_id.reset();
        }
      },
      fields);
}

void ClearRuleRef(EntityFields& fields) {
  std::visit(
      [](auto& f) {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, ExpenseFields> || std::is_same_v<T, IncomeFields>) {
          f.recurring_rule_id.reset();
          f.is_recurring = false;
        }
      },
      fields);
}

std::optional<util::Date> OccurrenceDate(const EntityFields& fields) {
  if (const auto* expense = std::get_if<ExpenseFields>(&fields)) {
    return expense->date;
  }
  if (const auto* income = std::get_if<IncomeFields>(&fields)) {
    return income->date;
  }
  return std::nullopt;
}

std::string DisplayName(const Entity& entity) {
  return std::visit(
      [](const auto& f) -> std::string {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, CategoryFields>) {
          return f.name;
        } else if constexpr (std::is_same_v<T, IncomeFields>) {
          return f.source;
        } else if constexpr (std::is_same_v<T, BudgetFields>) {
          return f.period;
        } else {
          return f.title;
        }
      },
      entity.fields);
}

std::vector<std::string> InvariantViolations(const Entity& entity) {
  std::vector<std::string> problems;
  const auto&              sync = entity.sync;

  if (sync.soft_deleted) {
    if (!sync.deleted_at_ms.has_value()) {
      problems.emplace_back("soft-deleted without deletedAt");
    }
    if (sync.status != SyncStatus::kDeleted && sync.status != SyncStatus::kSynced) {
      problems.emplace_back("soft-deleted with sync status " + std::string(ToString(sync.status)));
    }
  } else if (sync.deleted_at_ms.has_value()) {
    problems.emplace_back("deletedAt set on an active entity");
  }

  if (sync.updated_at_ms < sync.created_at_ms) {
    problems.emplace_back("updatedAt precedes createdAt");
  }

  if (!FieldsMatchKind(entity.kind, entity.fields)) {
    problems.emplace_back("field set does not match kind " + std::string(KindName(entity.kind)));
  }
  return problems;
}

} // namespace ledgersync::model
