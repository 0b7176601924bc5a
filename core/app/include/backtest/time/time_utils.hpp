#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock / simulated time carried by every record in the engine. A
// trading date is a Timestamp at 00:00:00 UTC of that day.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

constexpr std::int64_t kMillisPerDay = 86'400'000;

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Conversions between Timestamp, epoch milliseconds and ISO dates.
//
// @details
// ITimeProvider speaks int64 milliseconds; records carry Timestamp; config
// and JSON files carry "YYYY-MM-DD". Calendar arithmetic uses the
// days-from-civil algorithm so no platform-specific timegm()/gmtime_r() is
// needed and every conversion is in UTC.
//
// Thread-safety: Stateless. Safe from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(int year, unsigned month, unsigned day);

// -------------------------------------------------------------------------
// parse_date
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DD" into a UTC-midnight Timestamp.
//
// @throws InvalidConfiguration on malformed input or an impossible date
//         (month 13, February 30, ...).
// -------------------------------------------------------------------------
Timestamp parse_date(const std::string& text);

// "YYYY-MM-DD" for the UTC day containing tp.
std::string format_date(Timestamp tp);

// Truncates tp to 00:00:00 UTC of its day.
Timestamp start_of_day(Timestamp tp);

// tp shifted by a whole number of days.
Timestamp add_days(Timestamp tp, std::int64_t days);

// Whole days from `from` to `to` (negative when to < from).
std::int64_t days_between(Timestamp from, Timestamp to);

// True for Saturday and Sunday (UTC).
bool is_weekend(Timestamp tp);

}  // namespace backtest
