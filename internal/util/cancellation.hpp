#pragma once

#include <atomic>
#include <memory>

namespace ledgersync::util {

/*
  Cooperative cancellation. A default-constructed token is never cancelled.
*/
class CancellationToken {
 public:
  CancellationToken() = default;

  bool IsCancelled() const {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

 private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {
  }

  std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
 public:
  CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {
  }

  CancellationToken Token() const {
    return CancellationToken(flag_);
  }

  void Cancel() {
    flag_->store(true, std::memory_order_release);
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace ledgersync::util
