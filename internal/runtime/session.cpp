#include "session.hpp"

#include "internal/observability/logging.hpp"

namespace ledgersync::runtime {

Session::Session(std::shared_ptr<events::ChangeBus> bus, std::shared_ptr<sync::SyncState> state, std::shared_ptr<budget::BudgetMonitor> monitor)
    : bus_(std::move(bus)), state_(std::move(state)), monitor_(std::move(monitor)) {
  bus_->Start();
  state_->Start();
  if (monitor_) monitor_->Attach();
  LEDGERSYNC_LOG_DEBUG("session started");
}

Session::~Session() {
  if (monitor_) monitor_->Detach();
  bus_->Stop();
  state_->Reset();
  LEDGERSYNC_LOG_DEBUG("session closed");
}

} // namespace ledgersync::runtime
