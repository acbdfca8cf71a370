#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace ledgersync::util {

/*
  Civil (calendar) dates. Occurrence and budget dates carry no time of day;
  they are stored and exchanged as "YYYY-MM-DD".
*/

using Date = std::chrono::year_month_day;

// Throws InvalidValue for anything but a valid YYYY-MM-DD date.
Date        ParseDate(std::string_view text);
std::string FormatDate(const Date& date);

Date AddDays(const Date& date, int days);

// Calendar date of `now` shifted by a fixed UTC offset.
Date Today(TimePoint now, int utc_offset_minutes);

// 1 = Sunday ... 7 = Saturday
unsigned WeekdayNumber(const Date& date);

std::chrono::day LastDayOfMonth(std::chrono::year y, std::chrono::month m);

} // namespace ledgersync::util
