#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/entity.hpp"
#include "internal/store/entity_store.hpp"

namespace ledgersync::recurrence {

struct RuleGenerationResult {
  ledgersync::model::EntityKind kind = ledgersync::model::EntityKind::kRecurringExpense;
  std::string                   rule_id;
  std::string                   title;
  std::size_t                   generated = 0;
  bool                          capped    = false; // more occurrences are due; produced next run
  std::optional<std::string>    error;
};

struct GenerationReport {
  std::vector<RuleGenerationResult> rules;

  std::size_t TotalGenerated() const;
  std::size_t FailedRules() const;
};

/*
  Materializes due occurrences of active recurring rules as concrete
  expenses and incomes.

  Idempotent: each (rule, date) is created at most once, checked atomically
  against existing occurrences including tombstones, so a deleted occurrence
  is not resurrected. Generated rows are ordinary pending-create entities.
*/
class RecurrenceGenerator {
 public:
  static constexpr std::size_t kDefaultMaxOccurrencesPerRule = 100;

  explicit RecurrenceGenerator(std::shared_ptr<store::EntityStore> store, std::size_t max_occurrences_per_rule = kDefaultMaxOccurrencesPerRule,
                               int utc_offset_minutes = 0);

  // force: rescan from each rule's start date instead of the last generated one.
  GenerationReport GenerateDueOccurrences(const std::string& owner_id, bool force = false);

  // Latest occurrence date already materialized for a rule, deleted ones included.
  std::optional<util::Date> LastGeneratedThrough(const std::string& owner_id, const ledgersync::model::Entity& rule);

 private:
  void GenerateForRule(const ledgersync::model::Entity& rule, const util::Date& today, bool force, RuleGenerationResult& result);

  std::shared_ptr<store::EntityStore> store_;
  std::size_t                         max_per_rule_;
  int                                 utc_offset_minutes_;
};

// Concrete transaction for `rule` on `date`; id left empty.
ledgersync::model::Entity MakeOccurrence(const ledgersync::model::Entity& rule, const util::Date& date);

} // namespace ledgersync::recurrence
