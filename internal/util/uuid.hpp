#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace ledgersync::util {

/*
  UUID helpers

  Entity ids are RFC4122 v4 UUIDs in canonical lowercase text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// GenerateUUID() rendered as text
std::string NewId();

} // namespace ledgersync::util
