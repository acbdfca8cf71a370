#include "factory.hpp"

#include <stdexcept>

#include <google/protobuf/util/time_util.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/file_remote_store.hpp"
#include "internal/remote/memory_remote_store.hpp"
#if LEDGERSYNC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace ledgersync::factory {

using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const ledgersync::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if LEDGERSYNC_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    LEDGERSYNC_LOG_INFO("database opened", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  LEDGERSYNC_LOG_INFO("database opened", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<remote::RemoteStore> BuildRemote(const ledgersync::runtime::config::RemoteConfig& remote) {
  if (remote.has_directory()) {
    return std::make_shared<remote::FileRemoteStore>(remote.directory().path());
  }
  return std::make_shared<remote::MemoryRemoteStore>();
}

/*
    Build full application dependency graph
*/
Application Build(const ledgersync::runtime::config::RuntimeConfig& config, util::NowFn now) {
  Application app;
  app.config = config;

  // ------------------------------------------------------------------
  // Local storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config.database());
  app.bus        = std::make_shared<events::ChangeBus>();
  app.store      = std::make_shared<store::EntityStore>(app.repository, app.bus, std::move(now));

  // ------------------------------------------------------------------
  // Tombstones
  // ------------------------------------------------------------------
  app.tombstones = std::make_shared<tombstone::TombstoneManager>(app.store);
  app.retention  = tombstone::RetentionPolicy::FromConfig(config.retention());

  // ------------------------------------------------------------------
  // Sync
  // ------------------------------------------------------------------
  app.remote        = BuildRemote(config.remote());
  app.sync_state    = std::make_shared<sync::SyncState>();
  app.sync_engine   = std::make_shared<sync::SyncEngine>(app.store, app.remote, app.sync_state, config.sync().worker_threads());
  app.sync_interval = std::chrono::milliseconds(google::protobuf::util::TimeUtil::DurationToMilliseconds(config.sync().interval()));

  // ------------------------------------------------------------------
  // Recurrence and budgets
  // ------------------------------------------------------------------
  const auto& recurrence = config.recurrence();
  app.generator      = std::make_shared<recurrence::RecurrenceGenerator>(app.store, recurrence.max_occurrences_per_rule(), recurrence.utc_offset_minutes());
  app.budget_monitor = std::make_shared<budget::BudgetMonitor>(app.store, app.bus, recurrence.utc_offset_minutes());

  return app;
}

} // namespace ledgersync::factory
