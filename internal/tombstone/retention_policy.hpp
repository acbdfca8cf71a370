#pragma once

#include <array>
#include <chrono>

#include "config/config.pb.h"
#include "internal/model/entity_kind.hpp"

namespace ledgersync::tombstone {

// How long a tombstone of each kind is kept before the sweep purges it.
class RetentionPolicy {
 public:
  // 30 days for categories, 90 days for everything else.
  RetentionPolicy();

  static RetentionPolicy FromConfig(const ledgersync::runtime::config::RetentionConfig& config);

  void                      Set(ledgersync::model::EntityKind kind, std::chrono::milliseconds retention);
  std::chrono::milliseconds For(ledgersync::model::EntityKind kind) const;

 private:
  std::array<std::chrono::milliseconds, ledgersync::model::kDependencyOrder.size()> per_kind_;
};

} // namespace ledgersync::tombstone
