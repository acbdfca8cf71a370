#include "schedule.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"

namespace ledgersync::recurrence {

using ledgersync::model::Frequency;
using namespace std::chrono;

namespace {

util::Date Clamped(year y, month m, unsigned d) {
  const auto last = static_cast<unsigned>(util::LastDayOfMonth(y, m));
  return util::Date{y, m, day{std::min(d, last)}};
}

unsigned WeeklyAnchor(const RuleSchedule& schedule) {
  if (schedule.anchor >= 1 && schedule.anchor <= 7) return static_cast<unsigned>(schedule.anchor);
  return util::WeekdayNumber(schedule.start);
}

unsigned MonthlyAnchor(const RuleSchedule& schedule) {
  if (schedule.anchor >= 1 && schedule.anchor <= 31) return static_cast<unsigned>(schedule.anchor);
  return static_cast<unsigned>(schedule.start.day());
}

util::Date FirstCandidate(const RuleSchedule& schedule, const util::Date& from) {
  switch (schedule.frequency) {
    case Frequency::kDaily:
      return from;

    case Frequency::kWeekly: {
      const auto delta = (WeeklyAnchor(schedule) + 7 - util::WeekdayNumber(from)) % 7;
      return util::AddDays(from, static_cast<int>(delta));
    }

    case Frequency::kMonthly: {
      const auto anchor = MonthlyAnchor(schedule);
      auto       ym     = from.year() / from.month();
      auto       date   = Clamped(ym.year(), ym.month(), anchor);
      if (date < from) {
        ym += months{1};
        date = Clamped(ym.year(), ym.month(), anchor);
      }
      return date;
    }

    case Frequency::kYearly: {
      const auto m    = schedule.start.month();
      const auto d    = static_cast<unsigned>(schedule.start.day());
      auto       date = Clamped(from.year(), m, d);
      if (date < from) {
        date = Clamped(from.year() + years{1}, m, d);
      }
      return date;
    }
  }
  throw util::InvalidValue("unknown recurrence frequency " + std::to_string(static_cast<int>(schedule.frequency)));
}

} // namespace

std::optional<util::Date> FirstOnOrAfter(const RuleSchedule& schedule, const util::Date& from) {
  const auto date = FirstCandidate(schedule, std::max(from, schedule.start));
  if (schedule.end.has_value() && date > *schedule.end) {
    return std::nullopt;
  }
  return date;
}

std::optional<util::Date> NextAfter(const RuleSchedule& schedule, const util::Date& date) {
  return FirstOnOrAfter(schedule, util::AddDays(date, 1));
}

std::vector<util::Date> OccurrencesBetween(const RuleSchedule& schedule, const util::Date& from, const util::Date& through, std::size_t limit) {
  std::vector<util::Date> out;
  for (auto date = FirstOnOrAfter(schedule, from); date.has_value() && *date <= through && out.size() < limit;
       date = NextAfter(schedule, *date)) {
    out.push_back(*date);
  }
  return out;
}

} // namespace ledgersync::recurrence
