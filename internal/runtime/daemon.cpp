#include "daemon.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace ledgersync::runtime {

using observability::IntField;
using observability::StringField;

Daemon::Daemon(std::string owner_id, std::chrono::milliseconds interval, std::shared_ptr<recurrence::RecurrenceGenerator> generator,
               std::shared_ptr<sync::SyncEngine> sync_engine, std::shared_ptr<tombstone::TombstoneManager> tombstones,
               tombstone::RetentionPolicy retention)
    : owner_id_(std::move(owner_id)),
      interval_(interval),
      generator_(std::move(generator)),
      sync_engine_(std::move(sync_engine)),
      tombstones_(std::move(tombstones)),
      retention_(retention) {
}

Daemon::~Daemon() {
  Stop();
}

void Daemon::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  cancel_  = util::CancellationSource{};
  thread_  = std::thread(&Daemon::Run, this);

  LEDGERSYNC_LOG_INFO("daemon started", {StringField("owner", owner_id_), IntField("interval_ms", interval_.count())});
}

void Daemon::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    running_ = false;
    cancel_.Cancel();
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();

  LEDGERSYNC_LOG_INFO("daemon stopped", {StringField("owner", owner_id_)});
}

std::uint64_t Daemon::Cycles() const {
  std::lock_guard lock(mutex_);
  return cycles_;
}

void Daemon::RunOnce() {
  util::CancellationToken token;
  {
    std::lock_guard lock(mutex_);
    token = cancel_.Token();
  }

  try {
    const auto generated = generator_->GenerateDueOccurrences(owner_id_);
    if (generated.FailedRules() > 0) {
      LEDGERSYNC_LOG_WARN("recurrence run had failures", {IntField("failed_rules", static_cast<int64_t>(generated.FailedRules()))});
    }
  } catch (const std::exception& e) {
    LEDGERSYNC_LOG_ERROR("recurrence run failed", {StringField("error", e.what())});
  }

  try {
    sync_engine_->PerformFullSync(owner_id_, token);
  } catch (const std::exception& e) {
    LEDGERSYNC_LOG_ERROR("sync run failed", {StringField("error", e.what())});
  }

  try {
    tombstones_->Sweep(owner_id_, retention_);
  } catch (const std::exception& e) {
    LEDGERSYNC_LOG_ERROR("tombstone sweep failed", {StringField("error", e.what())});
  }

  std::lock_guard lock(mutex_);
  ++cycles_;
}

void Daemon::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    lock.unlock();
    RunOnce();
    lock.lock();
    cv_.wait_for(lock, interval_, [&] { return !running_; });
  }
}

} // namespace ledgersync::runtime
