#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace ledgersync::sync {

/*
  Fixed-size pool draining a blocking task queue.

  Exceptions thrown by a task are delivered through its future.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  std::future<void> Submit(std::function<void()> task);

  // Finishes queued tasks, then joins the workers.
  void Shutdown();

  std::size_t Size() const {
    return workers_.size();
  }

 private:
  std::optional<std::packaged_task<void()>> Dequeue();
  void                                      Run();

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::queue<std::packaged_task<void()>> queue_;
  bool                                   shutdown_ = false;

  std::vector<std::thread> workers_;
};

} // namespace ledgersync::sync
