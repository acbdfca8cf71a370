#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "internal/model/frequency.hpp"
#include "internal/util/date.hpp"

namespace ledgersync::recurrence {

/*
  Occurrence dates of a recurring rule.

    daily    every day from start
    weekly   weekday `anchor` (1 = Sunday .. 7 = Saturday)
    monthly  day `anchor` of each month, clamped to the month's last day
    yearly   the start date's month/day, Feb 29 -> Feb 28 in common years

  An out-of-range anchor falls back to the start date's weekday (weekly) or
  day of month (monthly). No occurrence precedes start or follows end.
*/
struct RuleSchedule {
  ledgersync::model::Frequency frequency = ledgersync::model::Frequency::kMonthly;
  util::Date                   start{};
  std::optional<util::Date>    end;
  int                          anchor = 1;
};

std::optional<util::Date> FirstOnOrAfter(const RuleSchedule& schedule, const util::Date& from);
std::optional<util::Date> NextAfter(const RuleSchedule& schedule, const util::Date& date);

// Occurrences in [from, through], at most `limit`.
std::vector<util::Date> OccurrencesBetween(const RuleSchedule& schedule, const util::Date& from, const util::Date& through, std::size_t limit);

} // namespace ledgersync::recurrence
