#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/recurrence/recurrence_generator.hpp"
#include "internal/sync/sync_engine.hpp"
#include "internal/tombstone/retention_policy.hpp"
#include "internal/tombstone/tombstone_manager.hpp"
#include "internal/util/cancellation.hpp"

namespace ledgersync::runtime {

/*
  Background maintenance loop for one owner.

  Every interval: generate due occurrences, run a full sync, sweep expired
  tombstones. A failing step is logged and the loop moves on; Stop() cancels
  an in-flight sync and joins.
*/
class Daemon {
 public:
  Daemon(std::string owner_id, std::chrono::milliseconds interval, std::shared_ptr<recurrence::RecurrenceGenerator> generator,
         std::shared_ptr<sync::SyncEngine> sync_engine, std::shared_ptr<tombstone::TombstoneManager> tombstones,
         tombstone::RetentionPolicy retention);
  ~Daemon();

  Daemon(const Daemon&)            = delete;
  Daemon& operator=(const Daemon&) = delete;

  void Start();
  void Stop();

  // One maintenance cycle on the calling thread.
  void RunOnce();

  std::uint64_t Cycles() const;

 private:
  void Run();

  std::string                                      owner_id_;
  std::chrono::milliseconds                        interval_;
  std::shared_ptr<recurrence::RecurrenceGenerator> generator_;
  std::shared_ptr<sync::SyncEngine>                sync_engine_;
  std::shared_ptr<tombstone::TombstoneManager>     tombstones_;
  tombstone::RetentionPolicy                       retention_;

  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  bool                     running_ = false;
  std::uint64_t            cycles_  = 0;
  util::CancellationSource cancel_;
  std::thread              thread_;
};

} // namespace ledgersync::runtime
