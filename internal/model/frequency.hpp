#pragma once

#include <cstdint>
#include <string_view>

namespace ledgersync::model {

enum class Frequency : std::uint8_t {
  kDaily   = 0,
  kWeekly  = 1,
  kMonthly = 2,
  kYearly  = 3,
};

std::string_view ToString(Frequency frequency);

// Throws util::InvalidValue.
Frequency ParseFrequency(std::string_view text);

} // namespace ledgersync::model
