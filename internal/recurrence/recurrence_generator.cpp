#include "recurrence_generator.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/recurrence/schedule.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledgersync::recurrence {

using ledgersync::model::Entity;
using ledgersync::model::EntityKind;
using ledgersync::model::RecurringRuleFields;
using observability::IntField;
using observability::StringField;

namespace {

db::EntityQuery OccurrencesOf(const Entity& rule) {
  db::EntityQuery query;
  query.kind              = ledgersync::model::OccurrenceKind(rule.kind);
  query.owner_id          = rule.owner_id;
  query.recurring_rule_id = rule.id;
  return query;
}

} // namespace

std::size_t GenerationReport::TotalGenerated() const {
  std::size_t total = 0;
  for (const auto& r : rules) total += r.generated;
  return total;
}

std::size_t GenerationReport::FailedRules() const {
  std::size_t failed = 0;
  for (const auto& r : rules) {
    if (r.error.has_value()) ++failed;
  }
  return failed;
}

Entity MakeOccurrence(const Entity& rule, const util::Date& date) {
  const auto& f = rule.As<RecurringRuleFields>();

  Entity occurrence;
  occurrence.owner_id = rule.owner_id;
  occurrence.kind     = ledgersync::model::OccurrenceKind(rule.kind);

  if (occurrence.kind == EntityKind::kIncome) {
    ledgersync::model::IncomeFields income;
    income.amount            = f.amount;
    income.date              = date;
    income.source            = f.title;
    income.notes             = f.notes;
    income.frequency         = f.frequency;
    income.is_recurring      = true;
    income.recurring_rule_id = rule.id;
    income.color             = f.color;
    income.icon              = f.icon;
    occurrence.fields        = std::move(income);
  } else {
    ledgersync::model::ExpenseFields expense;
    expense.amount            = f.amount;
    expense.date              = date;
    expense.title             = f.title;
    expense.notes             = f.notes;
    expense.category_id       = f.category_id;
    expense.is_recurring      = true;
    expense.recurring_rule_id = rule.id;
    expense.color             = f.color;
    expense.icon              = f.icon;
    occurrence.fields         = std::move(expense);
  }
  return occurrence;
}

RecurrenceGenerator::RecurrenceGenerator(std::shared_ptr<store::EntityStore> store, std::size_t max_occurrences_per_rule, int utc_offset_minutes)
    : store_(std::move(store)), max_per_rule_(max_occurrences_per_rule), utc_offset_minutes_(utc_offset_minutes) {
}

std::optional<util::Date> RecurrenceGenerator::LastGeneratedThrough(const std::string& owner_id, const Entity& rule) {
  auto query       = OccurrencesOf(rule);
  query.owner_id   = owner_id;
  query.sort       = db::SortKey::kOccurrenceDate;
  query.descending = true;
  query.limit      = 1;

  const auto latest = store_->Query(query);
  if (latest.empty()) return std::nullopt;
  return ledgersync::model::OccurrenceDate(latest.front().fields);
}

GenerationReport RecurrenceGenerator::GenerateDueOccurrences(const std::string& owner_id, bool force) {
  GenerationReport report;
  const auto       today = util::Today(util::FromUnixMillis(store_->NowMs()), utc_offset_minutes_);

  for (const auto kind : {EntityKind::kRecurringExpense, EntityKind::kRecurringIncome}) {
    const auto rules = store_->FetchByOwner(owner_id, kind, [](const Entity& rule) { return rule.As<RecurringRuleFields>().is_active; },
                                            db::SortKey::kCreatedAt);

    for (const auto& rule : rules) {
      RuleGenerationResult result;
      result.kind    = kind;
      result.rule_id = rule.id;
      result.title   = rule.As<RecurringRuleFields>().title;

      try {
        GenerateForRule(rule, today, force, result);
      } catch (const util::GenerationError& e) {
        result.error = e.what();
        LEDGERSYNC_LOG_ERROR("recurring rule generation failed", {StringField("rule", rule.id), StringField("error", e.what())});
      }

      if (result.generated > 0) {
        LEDGERSYNC_LOG_INFO("occurrences generated", {StringField("rule", rule.id), StringField("title", result.title),
                                                      IntField("count", static_cast<int64_t>(result.generated))});
      }
      report.rules.push_back(std::move(result));
    }
  }

  LEDGERSYNC_LOG_DEBUG("recurrence run finished", {StringField("owner", owner_id), IntField("generated", static_cast<int64_t>(report.TotalGenerated())),
                                                   IntField("failed_rules", static_cast<int64_t>(report.FailedRules()))});
  return report;
}

void RecurrenceGenerator::GenerateForRule(const Entity& rule, const util::Date& today, bool force, RuleGenerationResult& result) {
  try {
    const auto& f = rule.As<RecurringRuleFields>();

    const RuleSchedule schedule{f.frequency, f.start_date, f.end_date, f.day_of_month_week};

    auto through = today;
    if (f.end_date.has_value() && *f.end_date < through) {
      through = *f.end_date;
    }

    auto from = f.start_date;
    if (!force) {
      if (auto last = LastGeneratedThrough(rule.owner_id, rule); last.has_value()) {
        from = std::max(from, util::AddDays(*last, 1));
      }
    }

    for (auto date = FirstOnOrAfter(schedule, from); date.has_value() && *date <= through; date = NextAfter(schedule, *date)) {
      if (result.generated >= max_per_rule_) {
        result.capped = true;
        LEDGERSYNC_LOG_WARN("occurrence cap reached", {StringField("rule", rule.id), IntField("cap", static_cast<int64_t>(max_per_rule_))});
        break;
      }

      auto existing            = OccurrencesOf(rule);
      existing.occurrence_date = *date;
      if (store_->CreateIfAbsent(MakeOccurrence(rule, *date), existing).has_value()) {
        ++result.generated;
      }
    }
  } catch (const std::exception& e) {
    throw util::GenerationError("rule " + rule.id + " (" + result.title + "): " + e.what());
  }
}

} // namespace ledgersync::recurrence
