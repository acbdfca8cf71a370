#include "worker_pool.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace ledgersync::sync {

WorkerPool::WorkerPool(std::size_t threads) {
  threads = std::max<std::size_t>(threads, 1);
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  Shutdown();
}

std::future<void> WorkerPool::Submit(std::function<void()> task) {
  std::packaged_task<void()> packaged(std::move(task));
  auto                       future = packaged.get_future();
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::InvalidState("worker pool is shut down");
    }
    queue_.push(std::move(packaged));
  }
  cv_.notify_one();
  return future;
}

void WorkerPool::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
}

std::optional<std::packaged_task<void()>> WorkerPool::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  auto task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void WorkerPool::Run() {
  while (auto task = Dequeue()) {
    (*task)();
  }
}

} // namespace ledgersync::sync
