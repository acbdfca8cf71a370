#pragma once

#include <cstdint>
#include <string>

#include "internal/model/entity_kind.hpp"

namespace ledgersync::db::model {

// Pull high-water mark for one (owner, collection): the highest remote write
// sequence already applied.
struct CheckpointRecord {
  std::string                   owner_id;
  ledgersync::model::EntityKind kind            = ledgersync::model::EntityKind::kCategory;
  uint64_t                      last_remote_seq = 0;
  uint64_t                      updated_at_ms   = 0;
};

} // namespace ledgersync::db::model
