#include "change_bus.hpp"

#include <exception>
#include <vector>

#include "internal/observability/logging.hpp"

namespace ledgersync::events {

ChangeBus::~ChangeBus() {
  Stop();
}

void ChangeBus::Start() {
  std::lock_guard lock(mutex_);
  if (running_ || stopped_) return;
  running_ = true;
  thread_  = std::thread(&ChangeBus::Run, this);
}

void ChangeBus::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (stopped_) return;
    stopped_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();

  std::lock_guard lock(mutex_);
  running_ = false;
  std::queue<ChangeEvent>().swap(queue_);
  idle_cv_.notify_all();
}

ChangeBus::SubscriptionId ChangeBus::Subscribe(Handler handler) {
  std::lock_guard lock(handlers_mutex_);
  const auto      id = next_id_++;
  handlers_.emplace(id, std::move(handler));
  return id;
}

void ChangeBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(handlers_mutex_);
  handlers_.erase(id);
}

void ChangeBus::Publish(ChangeEvent event) {
  {
    std::lock_guard lock(mutex_);
    if (stopped_) return;
    queue_.push(std::move(event));
  }
  cv_.notify_one();
}

void ChangeBus::WaitIdle() {
  std::unique_lock lock(mutex_);
  if (!running_) return;
  idle_cv_.wait(lock, [&] { return (queue_.empty() && !delivering_) || !running_; });
}

void ChangeBus::Run() {
  while (true) {
    ChangeEvent event;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return stopped_ || !queue_.empty(); });
      if (queue_.empty()) {
        // stopped and drained
        break;
      }
      event = std::move(queue_.front());
      queue_.pop();
      delivering_ = true;
    }

    std::vector<Handler> handlers;
    {
      std::lock_guard lock(handlers_mutex_);
      handlers.reserve(handlers_.size());
      for (const auto& [_, handler] : handlers_) handlers.push_back(handler);
    }

    for (const auto& handler : handlers) {
      try {
        handler(event);
      } catch (const std::exception& e) {
        LEDGERSYNC_LOG_ERROR("change handler failed", {observability::StringField("entity_id", event.entity_id),
                                                        observability::StringField("change", ToString(event.type)),
                                                        observability::StringField("error", e.what())});
      }
    }

    {
      std::lock_guard lock(mutex_);
      delivering_ = false;
      if (queue_.empty()) idle_cv_.notify_all();
    }
  }
}

} // namespace ledgersync::events
