#include <atomic>
#include <cassert>
#include <cstddef>
#include <iostream>
#include <memory>
#include <string>

#include "internal/codec/entity_codec.hpp"
#include "internal/remote/memory_remote_store.hpp"
#include "internal/sync/sync_engine.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using ledgersync::model::Entity;
using ledgersync::model::EntityKind;
using ledgersync::model::ExpenseFields;
using ledgersync::model::SyncStatus;
using ledgersync::remote::MemoryRemoteStore;
using ledgersync::sync::ErrorSeverity;
using ledgersync::sync::SyncEngine;
using ledgersync::sync::SyncOutcome;
using ledgersync::sync::SyncReport;
using ledgersync::sync::SyncState;
using ledgersync::testing::MakeCategory;
using ledgersync::testing::MakeExpense;
using ledgersync::testing::StoreHarness;

constexpr const char* kOwner = "owner-1";

struct SyncHarness : StoreHarness {
  explicit SyncHarness(std::shared_ptr<MemoryRemoteStore> shared = std::make_shared<MemoryRemoteStore>())
      : remote(std::move(shared)),
        state(std::make_shared<SyncState>()),
        engine(store, remote, state, 2) {
    state->Start();
  }

  std::shared_ptr<MemoryRemoteStore> remote;
  std::shared_ptr<SyncState>         state;
  SyncEngine                         engine;
};

// Forwards to a memory remote and cancels the run once `cancel_after` upserts went through.
class CancellingRemote final : public ledgersync::remote::RemoteStore {
 public:
  CancellingRemote(std::shared_ptr<MemoryRemoteStore> inner, ledgersync::util::CancellationSource source, std::size_t cancel_after)
      : inner_(std::move(inner)), source_(std::move(source)), cancel_after_(cancel_after) {
  }

  void Ping() override {
    inner_->Ping();
  }

  void Upsert(const std::string& collection, const ledgersync::v1::RemoteDocument& document) override {
    inner_->Upsert(collection, document);
    if (++upserts_ == cancel_after_) source_.Cancel();
  }

  void MarkDeleted(const std::string& collection, const ledgersync::v1::RemoteDocument& document) override {
    inner_->MarkDeleted(collection, document);
  }

  ledgersync::v1::RemoteDocuments FetchSince(const std::string& collection, const std::string& owner_id, uint64_t after_seq) override {
    return inner_->FetchSince(collection, owner_id, after_seq);
  }

 private:
  std::shared_ptr<MemoryRemoteStore>  inner_;
  ledgersync::util::CancellationSource source_;
  std::size_t                          cancel_after_;
  std::atomic<std::size_t>             upserts_{0};
};

ledgersync::v1::RemoteDocument RemoteExpense(const std::string& id, ledgersync::model::Money amount, uint64_t updated_at_ms,
                                             bool deleted = false) {
  Entity entity             = MakeExpense(kOwner, amount, "2024-03-10", std::nullopt, "remote");
  entity.id                 = id;
  entity.sync.created_at_ms = updated_at_ms;
  entity.sync.updated_at_ms = updated_at_ms;
  entity.sync.soft_deleted  = deleted;
  if (deleted) {
    entity.sync.deleted_at_ms = updated_at_ms;
    entity.sync.deleted_by    = "other-device";
  }
  return ledgersync::codec::ToRemoteDocument(entity);
}

const ledgersync::sync::CollectionReport& ReportFor(const SyncReport& report, EntityKind kind) {
  for (const auto& c : report.collections) {
    if (c.kind == kind) return c;
  }
  throw ledgersync::util::NotFound("no collection report");
}

SyncStatus StatusOf(StoreHarness& h, EntityKind kind, const std::string& id) {
  return h.store->FetchById(kOwner, kind, id)->sync.status;
}

void TestPushMarksRowsSynced() {
  SyncHarness h;
  const auto  category = h.store->Create(MakeCategory(kOwner, "Food"));
  const auto  expense  = h.store->Create(MakeExpense(kOwner, 450, "2024-03-14", category.id));

  const auto report = h.engine.PerformFullSync(kOwner);
  assert(report.outcome == SyncOutcome::kCompleted);
  assert(report.errors.empty());
  assert(ReportFor(report, EntityKind::kExpense).pushed == 1);
  assert(ReportFor(report, EntityKind::kCategory).pushed == 1);

  assert(StatusOf(h, EntityKind::kExpense, expense.id) == SyncStatus::kSynced);
  assert(StatusOf(h, EntityKind::kCategory, category.id) == SyncStatus::kSynced);

  const auto pushed = h.remote->Get("expenses", expense.id);
  assert(pushed.has_value());
  assert(pushed->owner_id() == kOwner);
  assert(pushed->fields().fields().at("amount").number_value() == 450);

  const auto snapshot = h.state->Snapshot();
  assert(!snapshot.is_syncing);
  assert(snapshot.progress == 1.0);
  assert(snapshot.last_sync_at_ms == std::optional<uint64_t>(report.started_at_ms));
  assert(!snapshot.last_sync_error.has_value());
  assert(h.state->Describe().rfind("Last synced", 0) == 0);
}

void TestPushesTombstonesAsDeletions() {
  SyncHarness h;
  const auto  expense = h.store->Create(MakeExpense(kOwner, 450, "2024-03-14"));
  h.engine.PerformFullSync(kOwner);

  h.clock.Advance(1000);
  h.store->Run(kOwner, [&](ledgersync::store::EntityStore::Batch& batch) { batch.Tombstone(EntityKind::kExpense, expense.id, "user-1"); });

  const auto report = h.engine.PerformFullSync(kOwner);
  assert(report.outcome == SyncOutcome::kCompleted);
  assert(ReportFor(report, EntityKind::kExpense).pushed == 1);

  const auto remote = h.remote->Get("expenses", expense.id);
  assert(remote->deleted());
  assert(remote->deleted_by() == "user-1");
  assert(StatusOf(h, EntityKind::kExpense, expense.id) == SyncStatus::kSynced);
  assert(h.store->FetchById(kOwner, EntityKind::kExpense, expense.id)->sync.soft_deleted);
}

void TestPullInsertsAndSkipsUnknownTombstones() {
  SyncHarness h;
  const auto  t = h.clock.Ms();
  h.remote->Put("expenses", RemoteExpense("r-1", 100, t - 5000));
  h.remote->Put("expenses", RemoteExpense("r-2", 200, t - 4000));
  h.remote->Put("expenses", RemoteExpense("r-gone", 300, t - 3000, true));

  const auto report = h.engine.PerformFullSync(kOwner);
  assert(report.outcome == SyncOutcome::kCompleted);

  const auto& expenses = ReportFor(report, EntityKind::kExpense);
  assert(expenses.inserted == 2);
  assert(expenses.skipped == 1);
  // three remote writes, so the checkpoint is the third sequence
  assert(expenses.checkpoint_seq == std::optional<uint64_t>(3));
  assert(h.store->CheckpointOf(kOwner, EntityKind::kExpense) == 3);

  const auto pulled = h.store->FetchById(kOwner, EntityKind::kExpense, "r-1");
  assert(pulled.has_value());
  assert(pulled->sync.status == SyncStatus::kSynced);
  assert(pulled->sync.updated_at_ms == t - 5000);
  assert(!h.store->FetchById(kOwner, EntityKind::kExpense, "r-gone").has_value());

  // nothing new on the remote: a second run applies nothing
  const auto again = h.engine.PerformFullSync(kOwner);
  assert(ReportFor(again, EntityKind::kExpense).inserted == 0);
  assert(ReportFor(again, EntityKind::kExpense).overwritten == 0);
  assert(ReportFor(again, EntityKind::kExpense).pushed == 0);
  assert(h.store->FetchByOwner(kOwner, EntityKind::kExpense).size() == 2);
}

void TestNewerRemoteWinsAndTombstonePropagates() {
  SyncHarness h;
  const auto  kept    = h.store->Create(MakeExpense(kOwner, 100, "2024-03-14"));
  const auto  removed = h.store->Create(MakeExpense(kOwner, 200, "2024-03-14"));
  h.engine.PerformFullSync(kOwner);

  const auto later = h.clock.Ms() + 60000;
  auto       edit  = RemoteExpense(kept.id, 999, later);
  h.remote->Put("expenses", edit);
  h.remote->Put("expenses", RemoteExpense(removed.id, 200, later, true));

  h.clock.Advance(120000);
  const auto report = h.engine.PerformFullSync(kOwner);
  assert(report.outcome == SyncOutcome::kCompleted);
  assert(ReportFor(report, EntityKind::kExpense).overwritten == 2);

  const auto local = h.store->FetchById(kOwner, EntityKind::kExpense, kept.id);
  assert(local->As<ExpenseFields>().amount == 999);
  assert(local->sync.status == SyncStatus::kSynced);
  assert(local->sync.updated_at_ms == later);

  const auto tombstone = h.store->FetchById(kOwner, EntityKind::kExpense, removed.id);
  assert(tombstone->sync.soft_deleted);
  assert(tombstone->sync.deleted_by == "other-device");
}

void TestLateOfflineEditFromAnotherDeviceIsPulled() {
  auto        shared = std::make_shared<MemoryRemoteStore>();
  SyncHarness a(shared);
  SyncHarness b(shared);
  const auto  noon = ledgersync::testing::NoonMs("2024-03-15");

  // B records an expense at 12:00 while offline
  b.clock.Set(noon);
  const auto offline = b.store->Create(MakeExpense(kOwner, 700, "2024-03-15", std::nullopt, "books"));

  // A records one at 13:00 and syncs
  a.clock.Set(noon + 3600000);
  const auto online = a.store->Create(MakeExpense(kOwner, 300, "2024-03-15"));
  assert(a.engine.PerformFullSync(kOwner).outcome == SyncOutcome::kCompleted);

  // B comes back online at 14:00
  b.clock.Set(noon + 2 * 3600000);
  assert(b.engine.PerformFullSync(kOwner).outcome == SyncOutcome::kCompleted);
  assert(shared->Size("expenses") == 2);
  assert(b.store->FetchById(kOwner, EntityKind::kExpense, online.id).has_value());

  // B's expense is stamped 12:00, older than anything A pulled before, yet A still gets it
  a.clock.Set(noon + 3 * 3600000);
  const auto report = a.engine.PerformFullSync(kOwner);
  assert(report.outcome == SyncOutcome::kCompleted);
  assert(ReportFor(report, EntityKind::kExpense).inserted == 1);

  const auto pulled = a.store->FetchById(kOwner, EntityKind::kExpense, offline.id);
  assert(pulled.has_value());
  assert(pulled->As<ExpenseFields>().amount == 700);
  assert(pulled->sync.updated_at_ms == noon);
  assert(pulled->sync.status == SyncStatus::kSynced);
}

void TestLocalEditBeatsOlderRemoteCopy() {
  SyncHarness h;
  const auto  expense = h.store->Create(MakeExpense(kOwner, 100, "2024-03-14"));
  h.engine.PerformFullSync(kOwner);

  h.clock.Advance(10000);
  h.store->Update(kOwner, EntityKind::kExpense, expense.id, [](ledgersync::model::EntityFields& f) {
    std::get<ExpenseFields>(f).amount = 555;
  });

  const auto report = h.engine.PerformFullSync(kOwner);
  assert(report.outcome == SyncOutcome::kCompleted);
  assert(ReportFor(report, EntityKind::kExpense).pushed == 1);
  assert(h.remote->Get("expenses", expense.id)->fields().fields().at("amount").number_value() == 555);
  assert(h.store->FetchById(kOwner, EntityKind::kExpense, expense.id)->As<ExpenseFields>().amount == 555);
}

void TestPreflightFailureLeavesStoreUntouched() {
  SyncHarness h;
  const auto  expense = h.store->Create(MakeExpense(kOwner, 100, "2024-03-14"));
  h.remote->Put("expenses", RemoteExpense("r-1", 100, h.clock.Ms() - 1000));
  h.remote->SetAvailable(false);

  const auto report = h.engine.PerformFullSync(kOwner);
  assert(report.outcome == SyncOutcome::kFailed);
  assert(report.HasFatalError());
  assert(StatusOf(h, EntityKind::kExpense, expense.id) == SyncStatus::kCreated);
  assert(!h.store->FetchById(kOwner, EntityKind::kExpense, "r-1").has_value());
  assert(h.remote->WriteCount() == 0);

  const auto snapshot = h.state->Snapshot();
  assert(!snapshot.is_syncing);
  assert(!snapshot.last_sync_at_ms.has_value());
  assert(snapshot.last_sync_error.has_value());
  assert(snapshot.last_sync_error->find("remote unavailable") != std::string::npos);
  assert(h.state->Describe().rfind("Failed:", 0) == 0);

  // recovery clears the error
  h.remote->SetAvailable(true);
  const auto retry = h.engine.PerformFullSync(kOwner);
  assert(retry.outcome == SyncOutcome::kCompleted);
  assert(!h.state->Snapshot().last_sync_error.has_value());
  assert(StatusOf(h, EntityKind::kExpense, expense.id) == SyncStatus::kSynced);
}

void TestItemFailureIsTransient() {
  SyncHarness h;
  const auto  failing = h.store->Create(MakeExpense(kOwner, 100, "2024-03-14"));
  const auto  ok      = h.store->Create(MakeExpense(kOwner, 200, "2024-03-14"));
  h.remote->FailWritesFor(failing.id);

  const auto report = h.engine.PerformFullSync(kOwner);
  assert(report.outcome == SyncOutcome::kCompletedWithErrors);
  assert(!report.HasFatalError());
  assert(report.errors.size() == 1);
  assert(report.errors[0].severity == ErrorSeverity::kTransient);
  assert(report.errors[0].entity_id == failing.id);
  assert(ReportFor(report, EntityKind::kExpense).push_failed == 1);
  assert(ReportFor(report, EntityKind::kExpense).pushed == 1);

  assert(StatusOf(h, EntityKind::kExpense, failing.id) == SyncStatus::kCreated);
  assert(StatusOf(h, EntityKind::kExpense, ok.id) == SyncStatus::kSynced);

  const auto snapshot = h.state->Snapshot();
  assert(snapshot.last_sync_at_ms.has_value());
  assert(snapshot.last_sync_error.has_value());
}

void TestConnectionLostMidPush() {
  SyncHarness h;
  for (int i = 0; i < 3; ++i) {
    h.store->Create(MakeExpense(kOwner, 100 + i, "2024-03-14"));
  }
  h.remote->FailAfterWrites(2);

  const auto report = h.engine.PerformFullSync(kOwner);
  assert(report.outcome == SyncOutcome::kFailed);
  assert(ReportFor(report, EntityKind::kExpense).pushed == 2);
  assert(!ReportFor(report, EntityKind::kExpense).completed);

  const auto pending = h.engine.PendingCounts(kOwner);
  assert(pending.at(EntityKind::kExpense) == 1);
  assert(h.remote->Size("expenses") == 2);
  assert(!h.state->Snapshot().last_sync_at_ms.has_value());
}

void TestUndecodableDocumentIsSkipped() {
  SyncHarness h;
  auto        broken = RemoteExpense("r-broken", 100, h.clock.Ms() - 1000);
  broken.mutable_fields()->mutable_fields()->erase("date");
  h.remote->Put("expenses", broken);
  h.remote->Put("expenses", RemoteExpense("r-ok", 100, h.clock.Ms() - 500));

  const auto report = h.engine.PerformFullSync(kOwner);
  assert(report.outcome == SyncOutcome::kCompletedWithErrors);
  assert(ReportFor(report, EntityKind::kExpense).inserted == 1);
  assert(ReportFor(report, EntityKind::kExpense).skipped == 1);
  assert(report.errors.size() == 1);
  assert(report.errors[0].entity_id == "r-broken");
  assert(h.store->FetchById(kOwner, EntityKind::kExpense, "r-ok").has_value());
}

void TestCancellationStopsBeforeWork() {
  SyncHarness h;
  const auto  expense = h.store->Create(MakeExpense(kOwner, 100, "2024-03-14"));

  ledgersync::util::CancellationSource source;
  source.Cancel();
  const auto report = h.engine.PerformFullSync(kOwner, source.Token());

  assert(report.outcome == SyncOutcome::kCancelled);
  assert(StatusOf(h, EntityKind::kExpense, expense.id) == SyncStatus::kCreated);
  assert(h.remote->WriteCount() == 0);
  assert(h.state->Snapshot().last_sync_error == std::optional<std::string>("sync cancelled"));
  assert(!h.state->Snapshot().is_syncing);
}

void TestCancellationMidPushKeepsConfirmedRows() {
  SyncHarness h;
  assert(h.engine.PerformFullSync(kOwner).outcome == SyncOutcome::kCompleted);
  const auto previous_sync_at = h.state->Snapshot().last_sync_at_ms;
  assert(previous_sync_at.has_value());

  h.clock.Advance(60000);
  for (int i = 0; i < 5; ++i) {
    h.store->Create(MakeExpense(kOwner, 100 + i, "2024-03-14"));
    h.clock.Advance(10);
  }

  ledgersync::util::CancellationSource source;
  auto       remote = std::make_shared<CancellingRemote>(h.remote, source, 2);
  SyncEngine engine(h.store, remote, h.state, 2);

  const auto report = engine.PerformFullSync(kOwner, source.Token());
  assert(report.outcome == SyncOutcome::kCancelled);
  assert(!report.HasFatalError());
  assert(ReportFor(report, EntityKind::kExpense).pushed == 2);
  assert(!ReportFor(report, EntityKind::kExpense).completed);

  // confirmed writes stay synced, the rest wait for the next run
  assert(h.remote->Size("expenses") == 2);
  std::size_t synced = 0;
  for (const auto& e : h.store->FetchByOwner(kOwner, EntityKind::kExpense)) {
    if (e.sync.status == SyncStatus::kSynced) {
      ++synced;
      assert(h.remote->Get("expenses", e.id).has_value());
    } else {
      assert(e.sync.status == SyncStatus::kCreated);
    }
  }
  assert(synced == 2);
  assert(h.engine.PendingCounts(kOwner).at(EntityKind::kExpense) == 3);

  const auto snapshot = h.state->Snapshot();
  assert(snapshot.last_sync_at_ms == previous_sync_at);
  assert(snapshot.last_sync_error == std::optional<std::string>("sync cancelled"));
  assert(!snapshot.is_syncing);

  h.clock.Advance(60000);
  assert(h.engine.PerformFullSync(kOwner).outcome == SyncOutcome::kCompleted);
  assert(h.engine.PendingCounts(kOwner).at(EntityKind::kExpense) == 0);
}

void TestConcurrentSyncIsRejected() {
  SyncHarness h;
  h.store->Create(MakeExpense(kOwner, 100, "2024-03-14"));

  assert(h.state->TryBegin());
  const auto report = h.engine.PerformFullSync(kOwner);
  assert(report.outcome == SyncOutcome::kAlreadyRunning);
  assert(h.remote->WriteCount() == 0);
  h.state->Finish(std::nullopt, std::nullopt);

  assert(h.engine.PerformFullSync(kOwner).outcome == SyncOutcome::kCompleted);
}

void TestPendingCountsPerCollection() {
  SyncHarness h;
  h.store->Create(MakeCategory(kOwner, "Food"));
  h.store->Create(MakeExpense(kOwner, 100, "2024-03-14"));
  h.store->Create(MakeExpense(kOwner, 200, "2024-03-14"));
  h.store->Create(MakeExpense("someone-else", 300, "2024-03-14"));

  auto counts = h.engine.PendingCounts(kOwner);
  assert(counts.at(EntityKind::kCategory) == 1);
  assert(counts.at(EntityKind::kExpense) == 2);
  assert(counts.at(EntityKind::kBudget) == 0);

  h.engine.PerformFullSync(kOwner);
  counts = h.engine.PendingCounts(kOwner);
  assert(counts.at(EntityKind::kCategory) == 0);
  assert(counts.at(EntityKind::kExpense) == 0);
}

void TestUnstartedStateRejectsReads() {
  SyncState state;
  bool      threw = false;
  try {
    state.Snapshot();
  } catch (const ledgersync::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  state.Start();
  assert(state.Describe() == "Never synced");
}

} // namespace

int main() {
  TestPushMarksRowsSynced();
  TestPushesTombstonesAsDeletions();
  TestPullInsertsAndSkipsUnknownTombstones();
  TestNewerRemoteWinsAndTombstonePropagates();
  TestLateOfflineEditFromAnotherDeviceIsPulled();
  TestLocalEditBeatsOlderRemoteCopy();
  TestPreflightFailureLeavesStoreUntouched();
  TestItemFailureIsTransient();
  TestConnectionLostMidPush();
  TestUndecodableDocumentIsSkipped();
  TestCancellationStopsBeforeWork();
  TestCancellationMidPushKeepsConfirmedRows();
  TestConcurrentSyncIsRejected();
  TestPendingCountsPerCollection();
  TestUnstartedStateRejectsReads();

  std::cout << "ledgersync_unit_sync_engine: pass\n";
  return 0;
}
