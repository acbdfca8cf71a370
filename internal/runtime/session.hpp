#pragma once

#include <memory>

#include "internal/budget/budget_monitor.hpp"
#include "internal/events/change_bus.hpp"
#include "internal/sync/sync_state.hpp"

namespace ledgersync::runtime {

/*
  Lifetime of one running process: starts the change bus, opens the sync
  state and attaches the budget monitor; the destructor undoes all three in
  reverse order. The monitor is optional.
*/
class Session {
 public:
  Session(std::shared_ptr<events::ChangeBus> bus, std::shared_ptr<sync::SyncState> state, std::shared_ptr<budget::BudgetMonitor> monitor = nullptr);
  ~Session();

  Session(const Session&)            = delete;
  Session& operator=(const Session&) = delete;

 private:
  std::shared_ptr<events::ChangeBus>     bus_;
  std::shared_ptr<sync::SyncState>       state_;
  std::shared_ptr<budget::BudgetMonitor> monitor_;
};

} // namespace ledgersync::runtime
