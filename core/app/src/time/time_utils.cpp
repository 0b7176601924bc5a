#include "backtest/time/time_utils.hpp"

#include "backtest/error/errors.hpp"

#include <cstdio>

namespace backtest {

namespace {

struct CivilDate {
  int year;
  unsigned month;
  unsigned day;
};

// Floor division so that instants before the epoch land on the right day.
std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

CivilDate civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  const auto y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 +
                                  (m <= 2 ? 1 : 0));
  return CivilDate{y, m, d};
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned days_in_month(int y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  return (m == 2 && is_leap(y)) ? 29u : kDays[m - 1];
}

std::int64_t day_number(Timestamp tp) {
  return floor_div(timestamp_to_ms(tp), kMillisPerDay);
}

}  // namespace

// -----------------------------------------------------------------------------
// days_from_civil(): Gregorian date → days since epoch
// -----------------------------------------------------------------------------
std::int64_t days_from_civil(int year, unsigned month, unsigned day) {
  const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

// -----------------------------------------------------------------------------
// parse_date(): "YYYY-MM-DD" → Timestamp
// -----------------------------------------------------------------------------
Timestamp parse_date(const std::string& text) {
  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  char trailing = '\0';
  // %c after the day catches trailing garbage ("2024-01-02x").
  const int matched =
      std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &trailing);
  if (matched != 3 || text.size() != 10) {
    throw InvalidConfiguration("invalid date '" + text +
                               "', expected YYYY-MM-DD");
  }
  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
    throw InvalidConfiguration("invalid calendar date '" + text + "'");
  }
  return ms_to_timestamp(days_from_civil(year, month, day) * kMillisPerDay);
}

// -----------------------------------------------------------------------------
// format_date(): Timestamp → "YYYY-MM-DD"
// -----------------------------------------------------------------------------
std::string format_date(Timestamp tp) {
  const CivilDate c = civil_from_days(day_number(tp));
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", c.year, c.month, c.day);
  return buf;
}

Timestamp start_of_day(Timestamp tp) {
  return ms_to_timestamp(day_number(tp) * kMillisPerDay);
}

Timestamp add_days(Timestamp tp, std::int64_t days) {
  return tp + std::chrono::milliseconds{days * kMillisPerDay};
}

std::int64_t days_between(Timestamp from, Timestamp to) {
  return day_number(to) - day_number(from);
}

// -----------------------------------------------------------------------------
// is_weekend(): 1970-01-01 was a Thursday
// -----------------------------------------------------------------------------
bool is_weekend(Timestamp tp) {
  const std::int64_t z = day_number(tp);
  // 0 = Sunday ... 6 = Saturday
  const std::int64_t weekday = z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6;
  return weekday == 0 || weekday == 6;
}

}  // namespace backtest
