#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/entity_kind.hpp"
#include "internal/model/frequency.hpp"
#include "internal/model/sync_status.hpp"
#include "internal/util/errors.hpp"

namespace {

using ledgersync::model::EntityKind;
using ledgersync::model::SyncStatus;

void TestPendingAndMutationRules() {
  assert(ledgersync::model::IsPending(SyncStatus::kCreated));
  assert(ledgersync::model::IsPending(SyncStatus::kUpdated));
  assert(ledgersync::model::IsPending(SyncStatus::kDeleted));
  assert(!ledgersync::model::IsPending(SyncStatus::kSynced));

  assert(ledgersync::model::StatusAfterMutation(SyncStatus::kCreated) == SyncStatus::kCreated);
  assert(ledgersync::model::StatusAfterMutation(SyncStatus::kSynced) == SyncStatus::kUpdated);
  assert(ledgersync::model::StatusAfterMutation(SyncStatus::kUpdated) == SyncStatus::kUpdated);

  assert(ledgersync::model::CanTransition(SyncStatus::kCreated, SyncStatus::kSynced));
  assert(ledgersync::model::CanTransition(SyncStatus::kSynced, SyncStatus::kDeleted));
  assert(!ledgersync::model::CanTransition(SyncStatus::kSynced, SyncStatus::kCreated));
}

void TestStatusStringsRoundTripAndRejectUnknown() {
  for (auto status : {SyncStatus::kCreated, SyncStatus::kUpdated, SyncStatus::kDeleted, SyncStatus::kSynced}) {
    assert(ledgersync::model::ParseSyncStatus(ledgersync::model::ToString(status)) == status);
  }

  for (const std::string bad : {"pending", "SYNCED", "", "synced "}) {
    bool threw = false;
    try {
      (void)ledgersync::model::ParseSyncStatus(bad);
    } catch (const ledgersync::util::InvalidValue&) {
      threw = true;
    }
    assert(threw && "unrecognized sync status must be rejected");
  }
}

void TestFrequencyAndKindParsing() {
  assert(ledgersync::model::ParseFrequency("weekly") == ledgersync::model::Frequency::kWeekly);

  bool threw = false;
  try {
    (void)ledgersync::model::ParseFrequency("fortnightly");
  } catch (const ledgersync::util::InvalidValue&) {
    threw = true;
  }
  assert(threw);

  assert(ledgersync::model::ParseEntityKind("recurringExpenses") == EntityKind::kRecurringExpense);
  assert(ledgersync::model::ParseEntityKind("recurring-income") == EntityKind::kRecurringIncome);
  assert(ledgersync::model::CollectionName(EntityKind::kCategory) == "categories");
  assert(ledgersync::model::OccurrenceKind(EntityKind::kRecurringIncome) == EntityKind::kIncome);
  assert(ledgersync::model::OccurrenceKind(EntityKind::kRecurringExpense) == EntityKind::kExpense);
  assert(ledgersync::model::kDependencyOrder.front() == EntityKind::kCategory);
}

} // namespace

int main() {
  TestPendingAndMutationRules();
  TestStatusStringsRoundTripAndRejectUnknown();
  TestFrequencyAndKindParsing();

  std::cout << "ledgersync_unit_sync_status: pass\n";
  return 0;
}
