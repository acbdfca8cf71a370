#pragma once

#include <chrono>
#include <memory>

#include "config/config.pb.h"

#include "internal/budget/budget_monitor.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/change_bus.hpp"
#include "internal/recurrence/recurrence_generator.hpp"
#include "internal/remote/remote_store.hpp"
#include "internal/store/entity_store.hpp"
#include "internal/sync/sync_engine.hpp"
#include "internal/sync/sync_state.hpp"
#include "internal/tombstone/retention_policy.hpp"
#include "internal/tombstone/tombstone_manager.hpp"

namespace ledgersync::factory {

/*
  Application

  Owns all long-lived components of one process. Nothing is started here;
  runtime::Session starts the bus and sync state.
*/
struct Application {
  ledgersync::runtime::config::RuntimeConfig config;

  std::shared_ptr<db::Repository>    repository;
  std::shared_ptr<events::ChangeBus> bus;
  std::shared_ptr<store::EntityStore> store;

  std::shared_ptr<tombstone::TombstoneManager> tombstones;
  tombstone::RetentionPolicy                   retention;

  std::shared_ptr<remote::RemoteStore> remote;
  std::shared_ptr<sync::SyncState>     sync_state;
  std::shared_ptr<sync::SyncEngine>    sync_engine;

  std::shared_ptr<recurrence::RecurrenceGenerator> generator;
  std::shared_ptr<budget::BudgetMonitor>           budget_monitor;

  std::chrono::milliseconds sync_interval{0};
};

/*
  Build

  Composition root: the only place that knows concrete repository and
  remote types. `config` must already carry defaults (ConfigLoader).
*/
Application Build(const ledgersync::runtime::config::RuntimeConfig& config, util::NowFn now = util::Now);

std::shared_ptr<db::Repository>      BuildRepository(const ledgersync::runtime::config::DatabaseConfig& config);
std::shared_ptr<remote::RemoteStore> BuildRemote(const ledgersync::runtime::config::RemoteConfig& config);

} // namespace ledgersync::factory
