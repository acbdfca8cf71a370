#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/checkpoint_record.hpp"
#include "internal/store/entity_store.hpp"
#include "tests/support/fixtures.hpp"

#if LEDGERSYNC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using ledgersync::db::EntityQuery;
using ledgersync::db::ErrorCode;
using ledgersync::db::Repository;
using ledgersync::db::SortKey;
using ledgersync::db::memory::MemoryRepository;
using ledgersync::db::model::CheckpointRecord;
using ledgersync::model::Entity;
using ledgersync::model::EntityKind;
using ledgersync::model::ExpenseFields;
using ledgersync::model::IncomeFields;
using ledgersync::model::SyncStatus;
using ledgersync::testing::MakeCategory;
using ledgersync::testing::MakeExpense;
using ledgersync::testing::MakeIncome;
using ledgersync::util::ParseDate;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

// Repository rows carry their sync metadata verbatim.
Entity Stored(Entity entity, const std::string& id, uint64_t updated_at_ms, SyncStatus status = SyncStatus::kCreated) {
  entity.id                 = id;
  entity.sync.status        = status;
  entity.sync.created_at_ms = updated_at_ms;
  entity.sync.updated_at_ms = updated_at_ms;
  return entity;
}

Entity Tombstoned(Entity entity, uint64_t deleted_at_ms) {
  entity.sync.soft_deleted  = true;
  entity.sync.status        = SyncStatus::kDeleted;
  entity.sync.deleted_at_ms = deleted_at_ms;
  entity.sync.deleted_by    = "user-1";
  entity.sync.updated_at_ms = deleted_at_ms;
  return entity;
}

void VerifyInsertGetUpdateDelete(Repository& repo, const std::string& owner) {
  auto tx = repo.Begin();

  const auto expense = Stored(MakeExpense(owner, 1250, "2024-03-10", std::string("cat-1"), "books"), owner + "-life", 1000);
  assert(repo.InsertEntity(*tx, expense));

  auto duplicate = repo.InsertEntity(*tx, expense);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto read = repo.GetEntity(*tx, EntityKind::kExpense, expense.id);
  assert(read.has_value());
  assert(read->owner_id == owner);
  assert(read->sync.status == SyncStatus::kCreated);
  assert(read->sync.updated_at_ms == 1000);
  assert(read->As<ExpenseFields>().amount == 1250);
  assert(read->As<ExpenseFields>().title == "books");
  assert(read->As<ExpenseFields>().category_id == std::string("cat-1"));
  assert(read->As<ExpenseFields>().date == ParseDate("2024-03-10"));

  // same id, other kind: distinct row
  assert(!repo.GetEntity(*tx, EntityKind::kIncome, expense.id).has_value());

  auto updated                       = *read;
  updated.As<ExpenseFields>().amount = 999;
  updated.As<ExpenseFields>().category_id.reset();
  updated = Tombstoned(updated, 2000);
  assert(repo.UpdateEntity(*tx, updated));

  read = repo.GetEntity(*tx, EntityKind::kExpense, expense.id);
  assert(read->As<ExpenseFields>().amount == 999);
  assert(!read->As<ExpenseFields>().category_id.has_value());
  assert(read->sync.soft_deleted);
  assert(read->sync.deleted_at_ms == std::optional<uint64_t>(2000));
  assert(read->sync.deleted_by == "user-1");

  auto missing = Stored(MakeExpense(owner, 1, "2024-03-10"), owner + "-missing", 1000);
  assert(repo.UpdateEntity(*tx, missing).code == ErrorCode::NotFound);

  assert(repo.DeleteEntity(*tx, EntityKind::kExpense, expense.id));
  assert(!repo.GetEntity(*tx, EntityKind::kExpense, expense.id).has_value());
  assert(repo.DeleteEntity(*tx, EntityKind::kExpense, expense.id).code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyQueries(Repository& repo, const std::string& owner) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertEntity(*tx, Stored(MakeExpense(owner, 100, "2024-03-01", std::string("cat-a")), owner + "-e1", 1000)));
    assert(repo.InsertEntity(*tx, Stored(MakeExpense(owner, 300, "2024-03-05", std::string("cat-a")), owner + "-e2", 2000, SyncStatus::kSynced)));
    assert(repo.InsertEntity(
        *tx, Tombstoned(Stored(MakeExpense(owner, 500, "2024-03-03", std::string("cat-a")), owner + "-e3", 1500), 3000)));
    assert(repo.InsertEntity(*tx, Stored(MakeExpense(owner, 700, "2024-03-05"), owner + "-e4", 2500)));

    auto income                                 = MakeIncome(owner, 5000, "2024-03-01");
    income.As<IncomeFields>().is_recurring      = true;
    income.As<IncomeFields>().recurring_rule_id = "rule-1";
    assert(repo.InsertEntity(*tx, Stored(income, owner + "-i1", 1200)));

    assert(repo.InsertEntity(*tx, Stored(MakeExpense(owner + "-other", 100, "2024-03-01", std::string("cat-a")), owner + "-x1", 1000)));
    tx->Commit();
  }

  auto tx = repo.Begin();

  assert(repo.CountEntities(*tx, ledgersync::db::ActiveOf(EntityKind::kExpense, owner)) == 3);
  assert(repo.CountEntities(*tx, ledgersync::db::TombstonesOf(EntityKind::kExpense, owner)) == 1);

  EntityQuery by_category;
  by_category.kind        = EntityKind::kExpense;
  by_category.owner_id    = owner;
  by_category.category_id = "cat-a";
  assert(repo.CountEntities(*tx, by_category) == 3);

  by_category.soft_deleted = false;
  by_category.sort         = SortKey::kUpdatedAt;
  auto rows                = repo.QueryEntities(*tx, by_category);
  assert(rows.size() == 2);
  assert(rows[0].id == owner + "-e1" && rows[1].id == owner + "-e2");

  EntityQuery pending;
  pending.kind     = EntityKind::kExpense;
  pending.owner_id = owner;
  pending.statuses = {SyncStatus::kCreated, SyncStatus::kUpdated, SyncStatus::kDeleted};
  assert(repo.CountEntities(*tx, pending) == 3);

  auto window              = ledgersync::db::TombstonesOf(EntityKind::kExpense, owner);
  window.deleted_before_ms = 3001;
  assert(repo.CountEntities(*tx, window) == 1);
  window.deleted_before_ms = 3000;
  assert(repo.CountEntities(*tx, window) == 0);
  window.deleted_before_ms.reset();
  window.deleted_after_ms = 2999;
  assert(repo.CountEntities(*tx, window) == 1);

  EntityQuery on_date;
  on_date.kind            = EntityKind::kExpense;
  on_date.owner_id        = owner;
  on_date.occurrence_date = ParseDate("2024-03-05");
  assert(repo.CountEntities(*tx, on_date) == 2);

  EntityQuery latest;
  latest.kind       = EntityKind::kExpense;
  latest.owner_id   = owner;
  latest.sort       = SortKey::kOccurrenceDate;
  latest.descending = true;
  latest.limit      = 1;
  rows              = repo.QueryEntities(*tx, latest);
  assert(rows.size() == 1);
  assert(rows[0].As<ExpenseFields>().date == ParseDate("2024-03-05"));

  EntityQuery by_rule;
  by_rule.kind              = EntityKind::kIncome;
  by_rule.owner_id          = owner;
  by_rule.recurring_rule_id = "rule-1";
  rows                      = repo.QueryEntities(*tx, by_rule);
  assert(rows.size() == 1);
  assert(rows[0].As<IncomeFields>().is_recurring);

  auto expensive      = ledgersync::db::ActiveOf(EntityKind::kExpense, owner);
  expensive.predicate = [](const Entity& e) { return e.As<ExpenseFields>().amount > 200; };
  assert(repo.CountEntities(*tx, expensive) == 2);

  tx->Commit();
}

void VerifyCheckpoints(Repository& repo, const std::string& owner) {
  auto tx = repo.Begin();
  assert(!repo.GetCheckpoint(*tx, owner, EntityKind::kExpense).has_value());

  CheckpointRecord record;
  record.owner_id        = owner;
  record.kind            = EntityKind::kExpense;
  record.last_remote_seq = 5000;
  record.updated_at_ms   = NowMs();
  assert(repo.PutCheckpoint(*tx, record));

  record.last_remote_seq = 7000;
  assert(repo.PutCheckpoint(*tx, record));

  auto read = repo.GetCheckpoint(*tx, owner, EntityKind::kExpense);
  assert(read.has_value());
  assert(read->last_remote_seq == 7000);
  assert(!repo.GetCheckpoint(*tx, owner, EntityKind::kIncome).has_value());
  assert(!repo.GetCheckpoint(*tx, owner + "-other", EntityKind::kExpense).has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& owner) {
  const auto category = Stored(MakeCategory(owner, "Rolled back"), owner + "-rollback", 1000);
  {
    auto tx = repo.Begin();
    assert(repo.InsertEntity(*tx, category));
    tx->Rollback();
  }
  {
    // destructor rolls back an uncommitted transaction
    auto tx = repo.Begin();
    assert(repo.InsertEntity(*tx, category));
  }

  auto tx = repo.Begin();
  assert(!repo.GetEntity(*tx, EntityKind::kCategory, category.id).has_value());
  tx->Commit();
}

void VerifySerializedWriters(Repository& repo, const std::string& owner) {
  std::vector<std::thread> writers;
  for (int w = 0; w < 4; ++w) {
    writers.emplace_back([&repo, &owner, w] {
      for (int i = 0; i < 10; ++i) {
        auto       tx = repo.Begin();
        const auto id = owner + "-w" + std::to_string(w) + "-" + std::to_string(i);
        assert(repo.InsertEntity(*tx, Stored(MakeExpense(owner, i, "2024-03-01"), id, 1000)));
        tx->Commit();
      }
    });
  }
  for (auto& t : writers) t.join();

  auto tx = repo.Begin();
  assert(repo.CountEntities(*tx, ledgersync::db::ActiveOf(EntityKind::kExpense, owner)) == 40);
  tx->Commit();
}

void VerifyEntityStoreOnBackend(const std::shared_ptr<Repository>& repo, const std::string& owner) {
  ledgersync::testing::ManualClock clock(ledgersync::testing::NoonMs("2024-03-15"));
  auto                             bus = std::make_shared<ledgersync::events::ChangeBus>();
  ledgersync::store::EntityStore   store(repo, bus, clock.Fn());

  const auto created = store.Create(MakeExpense(owner, 100, "2024-03-14"));
  assert(store.MarkSynced(owner, EntityKind::kExpense, created.id, created.sync.updated_at_ms));
  assert(store.FetchById(owner, EntityKind::kExpense, created.id)->sync.status == SyncStatus::kSynced);

  auto remote                       = *store.FetchById(owner, EntityKind::kExpense, created.id);
  remote.As<ExpenseFields>().amount = 400;
  remote.sync.updated_at_ms         = clock.Ms() + 1000;
  assert(store.ApplyRemote(remote) == ledgersync::store::ApplyOutcome::kOverwritten);
  assert(store.ApplyRemote(remote) == ledgersync::store::ApplyOutcome::kSkippedOlder);
  assert(store.FetchById(owner, EntityKind::kExpense, created.id)->As<ExpenseFields>().amount == 400);

  store.AdvanceCheckpoint(owner, EntityKind::kExpense, 9000);
  store.AdvanceCheckpoint(owner, EntityKind::kExpense, 8000);
  assert(store.CheckpointOf(owner, EntityKind::kExpense) == 9000);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& owner) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertEntity(*tx, Tombstoned(Stored(MakeCategory(owner, "Durable"), owner + "-durable", 1000), 4000)));

    CheckpointRecord record;
    record.owner_id        = owner;
    record.kind            = EntityKind::kCategory;
    record.last_remote_seq = 4000;
    record.updated_at_ms   = NowMs();
    assert(repo->PutCheckpoint(*tx, record));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto c  = repo->GetEntity(*tx, EntityKind::kCategory, owner + "-durable");
  assert(c.has_value());
  assert(c->sync.soft_deleted);
  assert(c->sync.deleted_at_ms == std::optional<uint64_t>(4000));
  assert(c->As<ledgersync::model::CategoryFields>().name == "Durable");

  auto checkpoint = repo->GetCheckpoint(*tx, owner, EntityKind::kCategory);
  assert(checkpoint.has_value());
  assert(checkpoint->last_remote_seq == 4000);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if LEDGERSYNC_DB_SQLITE
// A version 1 file stored client timestamps as checkpoints; bootstrap renames
// the column and resets the checkpoints so the next pull starts from scratch.
void VerifyCheckpointMigration() {
  const auto path = (std::filesystem::temp_directory_path() / ("ledgersync_migration_" + std::to_string(NowMs()) + ".db")).string();
  {
    ledgersync::db::sqlite::SqliteDB db(path);
    db.Exec("CREATE TABLE sync_checkpoints (owner_id TEXT NOT NULL, kind INTEGER NOT NULL, last_remote_updated_at_ms INTEGER NOT NULL, "
            "updated_at_ms INTEGER NOT NULL, PRIMARY KEY (owner_id, kind));");
    db.Exec("INSERT INTO sync_checkpoints VALUES ('owner-old', 5, 1710504000000, 1710504000000);");
    db.SetUserVersion(1);
  }

  {
    auto db = std::make_shared<ledgersync::db::sqlite::SqliteDB>(path);
    ledgersync::db::sqlite::BootstrapSchema(*db);
    assert(db->UserVersion() == 2);

    ledgersync::db::sqlite::SqliteRepository repo(db);
    auto                                     tx         = repo.Begin();
    auto                                     checkpoint = repo.GetCheckpoint(*tx, "owner-old", EntityKind::kExpense);
    assert(checkpoint.has_value());
    assert(checkpoint->last_remote_seq == 0);
    tx->Commit();
  }

  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("ledgersync_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<ledgersync::db::sqlite::SqliteDB>(db_path);
    ledgersync::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<ledgersync::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyInsertGetUpdateDelete(*repo, backend.name + "-life");
  VerifyQueries(*repo, backend.name + "-query");
  VerifyCheckpoints(*repo, backend.name + "-checkpoint");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifySerializedWriters(*repo, backend.name + "-writers");
  VerifyEntityStoreOnBackend(repo, backend.name + "-store");

  VerifyRestartDurability(backend, backend.name + "-restart");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if LEDGERSYNC_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
  VerifyCheckpointMigration();
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "ledgersync_integration_repository_parity: pass\n";
  return 0;
}
