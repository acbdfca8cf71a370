#include "frequency.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace ledgersync::model {

std::string_view ToString(Frequency frequency) {
  switch (frequency) {
    case Frequency::kDaily:
      return "daily";
    case Frequency::kWeekly:
      return "weekly";
    case Frequency::kMonthly:
      return "monthly";
    case Frequency::kYearly:
      return "yearly";
  }
  return "unknown";
}

Frequency ParseFrequency(std::string_view text) {
  if (text == "daily") return Frequency::kDaily;
  if (text == "weekly") return Frequency::kWeekly;
  if (text == "monthly") return Frequency::kMonthly;
  if (text == "yearly") return Frequency::kYearly;
  throw util::InvalidValue("unrecognized frequency '" + std::string(text) + "'");
}

} // namespace ledgersync::model
