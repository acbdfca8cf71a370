#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <thread>

#include "change_event.hpp"

namespace ledgersync::events {

/*
  Fire-and-forget change notifications.

  Publish() only enqueues; a single dispatcher thread delivers events to
  subscribers in publish order. Handler exceptions are logged and do not
  stop delivery. Subscribers must tolerate duplicates.

  Events published before Start() are held until the dispatcher runs;
  events published after Stop() are dropped.
*/
class ChangeBus {
 public:
  using Handler        = std::function<void(const ChangeEvent&)>;
  using SubscriptionId = std::uint64_t;

  ChangeBus() = default;
  ~ChangeBus();

  ChangeBus(const ChangeBus&)            = delete;
  ChangeBus& operator=(const ChangeBus&) = delete;

  void Start();

  // Drains pending events, then joins the dispatcher.
  void Stop();

  SubscriptionId Subscribe(Handler handler);
  void           Unsubscribe(SubscriptionId id);

  void Publish(ChangeEvent event);

  // Blocks until every event published so far has been delivered.
  void WaitIdle();

 private:
  void Run();

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::queue<ChangeEvent> queue_;
  bool                    running_    = false;
  bool                    stopped_    = false;
  bool                    delivering_ = false;
  std::thread             thread_;

  std::mutex                          handlers_mutex_;
  std::map<SubscriptionId, Handler>   handlers_;
  SubscriptionId                      next_id_ = 1;
};

} // namespace ledgersync::events
