#include "sync_state.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledgersync::sync {

void SyncState::RequireStarted() const {
  if (!started_) {
    throw util::InvalidState("sync state read before the session started");
  }
}

void SyncState::Start() {
  std::lock_guard lock(mutex_);
  started_  = true;
  snapshot_ = SyncSnapshot{};
}

void SyncState::Reset() {
  std::lock_guard lock(mutex_);
  started_  = false;
  snapshot_ = SyncSnapshot{};
}

bool SyncState::IsStarted() const {
  std::lock_guard lock(mutex_);
  return started_;
}

bool SyncState::TryBegin() {
  std::lock_guard lock(mutex_);
  RequireStarted();
  if (snapshot_.is_syncing) return false;

  snapshot_.is_syncing        = true;
  snapshot_.progress          = 0.0;
  snapshot_.current_operation = "starting";
  return true;
}

void SyncState::SetProgress(double fraction, std::string operation) {
  std::lock_guard lock(mutex_);
  RequireStarted();
  // monotonic within one run; parallel collections may report out of order
  snapshot_.progress          = std::max(snapshot_.progress, std::clamp(fraction, 0.0, 1.0));
  snapshot_.current_operation = std::move(operation);
}

void SyncState::Finish(std::optional<uint64_t> last_sync_at_ms, std::optional<std::string> error) {
  std::lock_guard lock(mutex_);
  RequireStarted();
  snapshot_.is_syncing        = false;
  snapshot_.current_operation.clear();
  if (last_sync_at_ms.has_value()) {
    snapshot_.last_sync_at_ms = last_sync_at_ms;
    snapshot_.progress        = 1.0;
  }
  snapshot_.last_sync_error = std::move(error);
}

SyncSnapshot SyncState::Snapshot() const {
  std::lock_guard lock(mutex_);
  RequireStarted();
  return snapshot_;
}

std::string SyncState::Describe() const {
  const auto s = Snapshot();

  if (s.is_syncing) {
    return "Syncing: " + s.current_operation + " (" + std::to_string(static_cast<int>(std::lround(s.progress * 100))) + "%)";
  }
  if (s.last_sync_error.has_value()) {
    return "Failed: " + *s.last_sync_error;
  }
  if (s.last_sync_at_ms.has_value()) {
    return "Last synced " + util::FormatMillis(*s.last_sync_at_ms);
  }
  return "Never synced";
}

} // namespace ledgersync::sync
