#include "retention_policy.hpp"

namespace ledgersync::tombstone {

using ledgersync::model::EntityKind;

namespace {

std::chrono::milliseconds Days(uint32_t days) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::days(days));
}

} // namespace

RetentionPolicy::RetentionPolicy() {
  per_kind_.fill(Days(90));
  Set(EntityKind::kCategory, Days(30));
}

RetentionPolicy RetentionPolicy::FromConfig(const ledgersync::runtime::config::RetentionConfig& config) {
  RetentionPolicy policy;
  if (config.categories_days() > 0) policy.Set(EntityKind::kCategory, Days(config.categories_days()));
  if (config.budgets_days() > 0) policy.Set(EntityKind::kBudget, Days(config.budgets_days()));
  if (config.incomes_days() > 0) policy.Set(EntityKind::kIncome, Days(config.incomes_days()));
  if (config.recurring_expenses_days() > 0) policy.Set(EntityKind::kRecurringExpense, Days(config.recurring_expenses_days()));
  if (config.recurring_incomes_days() > 0) policy.Set(EntityKind::kRecurringIncome, Days(config.recurring_incomes_days()));
  if (config.expenses_days() > 0) policy.Set(EntityKind::kExpense, Days(config.expenses_days()));
  return policy;
}

void RetentionPolicy::Set(EntityKind kind, std::chrono::milliseconds retention) {
  per_kind_[static_cast<size_t>(kind)] = retention;
}

std::chrono::milliseconds RetentionPolicy::For(EntityKind kind) const {
  return per_kind_[static_cast<size_t>(kind)];
}

} // namespace ledgersync::tombstone
