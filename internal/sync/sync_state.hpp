#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace ledgersync::sync {

struct SyncSnapshot {
  bool                       is_syncing = false;
  double                     progress   = 0.0;
  std::string                current_operation;
  std::optional<uint64_t>    last_sync_at_ms;
  std::optional<std::string> last_sync_error;
};

/*
  Process-wide sync status side channel.

  Written only by the sync engine, read by anyone. The owning session calls
  Start() before the first sync and Reset() on teardown; reading a state that
  was never started throws InvalidState.
*/
class SyncState {
 public:
  void Start();
  void Reset();
  bool IsStarted() const;

  // false if a sync is already in flight
  bool TryBegin();
  void SetProgress(double fraction, std::string operation);

  // Clears is_syncing. last_sync_at is kept when not given; the error is
  // replaced (cleared on success).
  void Finish(std::optional<uint64_t> last_sync_at_ms, std::optional<std::string> error);

  SyncSnapshot Snapshot() const;

  // "Syncing: pushing expenses (42%)", "Last synced 2024-...", "Failed: ..."
  std::string Describe() const;

 private:
  void RequireStarted() const;

  mutable std::mutex mutex_;
  bool               started_ = false;
  SyncSnapshot       snapshot_;
};

} // namespace ledgersync::sync
