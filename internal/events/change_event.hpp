#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/entity_kind.hpp"

namespace ledgersync::events {

enum class ChangeType : std::uint8_t {
  kCreated,
  kUpdated,
  kSoftDeleted,
  kRestored,
  kHardDeleted,
  kSynced,
  kRemoteApplied,
};

constexpr std::string_view ToString(ChangeType type) {
  switch (type) {
    case ChangeType::kCreated:
      return "created";
    case ChangeType::kUpdated:
      return "updated";
    case ChangeType::kSoftDeleted:
      return "soft_deleted";
    case ChangeType::kRestored:
      return "restored";
    case ChangeType::kHardDeleted:
      return "hard_deleted";
    case ChangeType::kSynced:
      return "synced";
    case ChangeType::kRemoteApplied:
      return "remote_applied";
  }
  return "unknown";
}

// Published after the owning transaction commits.
struct ChangeEvent {
  std::string                 owner_id;
  ledgersync::model::EntityKind kind = ledgersync::model::EntityKind::kExpense;
  std::string                 entity_id;
  ChangeType                  type  = ChangeType::kUpdated;
  uint64_t                    at_ms = 0;
};

} // namespace ledgersync::events
