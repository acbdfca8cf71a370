#include "date.hpp"

#include <cstdio>

#include "internal/util/errors.hpp"

namespace ledgersync::util {

Date ParseDate(std::string_view text) {
  int  y = 0;
  unsigned m = 0;
  unsigned d = 0;
  char tail  = 0;

  const std::string buf(text);
  if (buf.size() != 10 || std::sscanf(buf.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3) {
    throw InvalidValue("invalid date '" + buf + "': expected YYYY-MM-DD");
  }

  const Date date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
  if (!date.ok()) {
    throw InvalidValue("invalid date '" + buf + "': no such calendar day");
  }
  return date;
}

std::string FormatDate(const Date& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()));
  return buf;
}

Date AddDays(const Date& date, int days) {
  return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

Date Today(TimePoint now, int utc_offset_minutes) {
  const auto shifted = now + std::chrono::minutes{utc_offset_minutes};
  return Date{std::chrono::floor<std::chrono::days>(shifted)};
}

unsigned WeekdayNumber(const Date& date) {
  return std::chrono::weekday{std::chrono::sys_days{date}}.c_encoding() + 1;
}

std::chrono::day LastDayOfMonth(std::chrono::year y, std::chrono::month m) {
  return std::chrono::year_month_day_last{y, std::chrono::month_day_last{m}}.day();
}

} // namespace ledgersync::util
