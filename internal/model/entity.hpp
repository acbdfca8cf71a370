#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/entity_kind.hpp"
#include "internal/model/frequency.hpp"
#include "internal/model/sync_status.hpp"
#include "internal/util/date.hpp"
#include "internal/util/errors.hpp"

namespace ledgersync::model {

// Minor currency units (cents).
using Money = std::int64_t;

struct CategoryFields {
  std::string  name;
  std::string  icon;
  std::string  color;
  bool         is_default = false;
  std::int32_t order      = 0;
};

struct BudgetFields {
  Money                      amount = 0;
  std::string                period;
  util::Date                 start_date{};
  util::Date                 end_date{};
  double                     alert_threshold = 0.8;
  bool                       is_active       = true;
  std::optional<std::string> category_id;
};

struct IncomeFields {
  Money                      amount = 0;
  util::Date                 date{};
  std::string                source;
  std::string                notes;
  std::optional<Frequency>   frequency;
  bool                       is_recurring = false;
  std::optional<std::string> recurring_rule_id;
  std::string                color;
  std::string                icon;
  std::int32_t               order = 0;
};

struct ExpenseFields {
  Money                      amount = 0;
  util::Date                 date{};
  std::string                title;
  std::string                notes;
  std::optional<std::string> category_id;
  bool                       is_recurring = false;
  std::optional<std::string> recurring_rule_id;
  std::string                color;
  std::string                icon;
};

/*
  Template for RecurringExpense and RecurringIncome.

  day_of_month_week: 1-7 weekday (1 = Sunday) for weekly rules,
  1-31 day of month for monthly rules, ignored otherwise.
  category_id is only meaningful for expense rules.
*/
struct RecurringRuleFields {
  std::string                title;
  Money                      amount = 0;
  std::string                notes;
  std::optional<std::string> category_id;
  std::string                color;
  std::string                icon;
  Frequency                  frequency = Frequency::kMonthly;
  util::Date                 start_date{};
  std::optional<util::Date>  end_date;
  std::int32_t               day_of_month_week = 1;
  bool                       is_active         = true;
};

using EntityFields = std::variant<CategoryFields, BudgetFields, IncomeFields, ExpenseFields, RecurringRuleFields>;

struct SyncMetadata {
  SyncStatus              status       = SyncStatus::kCreated;
  bool                    soft_deleted = false;
  std::optional<uint64_t> deleted_at_ms;
  std::string             deleted_by;
  uint64_t                created_at_ms = 0;
  uint64_t                updated_at_ms = 0;
};

struct Entity {
  std::string  id;
  std::string  owner_id;
  EntityKind   kind = EntityKind::kExpense;
  EntityFields fields;
  SyncMetadata sync;

  template <typename T>
  T& As() {
    if (auto* typed = std::get_if<T>(&fields)) {
      return *typed;
    }
    throw util::InvalidState("entity " + id + " does not hold the requested field set");
  }

  template <typename T>
  const T& As() const {
    if (const auto* typed = std::get_if<T>(&fields)) {
      return *typed;
    }
    throw util::InvalidState("entity " + id + " does not hold the requested field set");
  }
};

EntityFields DefaultFields(EntityKind kind);
bool         FieldsMatchKind(EntityKind kind, const EntityFields& fields);

// Foreign keys. Empty optional when the field set has no such reference.
std::optional<std::string> CategoryRef(const EntityFields& fields);
std::optional<std::string> RuleRef(const EntityFields& fields);

// Reassign to "uncategorized".
void ClearCategoryRef(EntityFields& fields);
// Detach a concrete transaction from its recurring rule.
void ClearRuleRef(EntityFields& fields);

// Date of a concrete expense/income.
std::optional<util::Date> OccurrenceDate(const EntityFields& fields);

std::string DisplayName(const Entity& entity);

// Tombstone and timestamp invariants; empty when the entity is consistent.
std::vector<std::string> InvariantViolations(const Entity& entity);

} // namespace ledgersync::model
