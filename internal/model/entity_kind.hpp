#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace ledgersync::model {

enum class EntityKind : std::uint8_t {
  kCategory         = 0,
  kBudget           = 1,
  kIncome           = 2,
  kRecurringExpense = 3,
  kRecurringIncome  = 4,
  kExpense          = 5,
};

// Parents before dependents. Sync and listings walk kinds in this order.
inline constexpr std::array<EntityKind, 6> kDependencyOrder = {
    EntityKind::kCategory,         EntityKind::kBudget,          EntityKind::kIncome,
    EntityKind::kRecurringExpense, EntityKind::kRecurringIncome, EntityKind::kExpense,
};

constexpr bool IsRecurringRule(EntityKind kind) {
  return kind == EntityKind::kRecurringExpense || kind == EntityKind::kRecurringIncome;
}

// Kind of the concrete transactions a rule materializes.
constexpr EntityKind OccurrenceKind(EntityKind rule_kind) {
  return rule_kind == EntityKind::kRecurringIncome ? EntityKind::kIncome : EntityKind::kExpense;
}

// Remote collection name ("recurringExpenses", ...).
std::string_view CollectionName(EntityKind kind);

// Singular display name ("recurring-expense", ...).
std::string_view KindName(EntityKind kind);

// Accepts either a collection name or a kind name. Throws util::InvalidValue.
EntityKind ParseEntityKind(std::string_view text);

} // namespace ledgersync::model
