#include "sync_status.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace ledgersync::model {

std::string_view ToString(SyncStatus status) {
  switch (status) {
    case SyncStatus::kCreated:
      return "created";
    case SyncStatus::kUpdated:
      return "updated";
    case SyncStatus::kDeleted:
      return "deleted";
    case SyncStatus::kSynced:
      return "synced";
  }
  return "unknown";
}

SyncStatus ParseSyncStatus(std::string_view text) {
  if (text == "created") return SyncStatus::kCreated;
  if (text == "updated") return SyncStatus::kUpdated;
  if (text == "deleted") return SyncStatus::kDeleted;
  if (text == "synced") return SyncStatus::kSynced;
  throw util::InvalidValue("unrecognized sync status '" + std::string(text) + "'");
}

} // namespace ledgersync::model
