#pragma once

#include <cstdint>
#include <string_view>

namespace ledgersync::model {

/*
  Local change pending against the remote store.

  created ──push──▶ synced
  updated ──push──▶ synced ──mutation──▶ updated
  deleted ──push──▶ synced ──soft delete──▶ deleted

  Only the sync engine produces kSynced; only local mutation paths produce
  the other three.
*/
enum class SyncStatus : std::uint8_t {
  kCreated = 0,
  kUpdated = 1,
  kDeleted = 2,
  kSynced  = 3,
};

constexpr bool IsPending(SyncStatus status) {
  return status != SyncStatus::kSynced;
}

// Status after a local field mutation: a never-pushed entity stays created.
constexpr SyncStatus StatusAfterMutation(SyncStatus status) {
  return status == SyncStatus::kCreated ? SyncStatus::kCreated : SyncStatus::kUpdated;
}

constexpr bool CanTransition(SyncStatus from, SyncStatus to) {
  if (from == to) {
    return true;
  }
  // created is an initial state only
  return to != SyncStatus::kCreated;
}

std::string_view ToString(SyncStatus status);

// Throws util::InvalidValue on anything but created|updated|deleted|synced.
SyncStatus ParseSyncStatus(std::string_view text);

} // namespace ledgersync::model
