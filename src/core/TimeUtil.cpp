/* @file TimeUtil.cpp
 * @brief UTC conversions via timegm/gmtime_r
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <ctime>

// RollStart headers
#include "core/ScheduleError.hpp"
#include "core/TimeUtil.hpp"

namespace rollstart::core {

  namespace {

    TimePoint fromFields(int y, int mo, int d, int h, int mi, int s, const std::string& text) {
      if (y < 1970 || mo < 1 || mo > 12 || d < 1 || d > 31 || h < 0 || h > 23 || mi < 0 ||
          mi > 59 || s < 0 || s > 59)
        throw ScheduleError(ErrorCode::InvalidArgument, "[TimeUtil] time out of range: " + text);

      std::tm tm{};
      tm.tm_year = y - 1900;
      tm.tm_mon = mo - 1;
      tm.tm_mday = d;
      tm.tm_hour = h;
      tm.tm_min = mi;
      tm.tm_sec = s;
      const std::time_t t = ::timegm(&tm);
      return TimePoint{ std::chrono::seconds{ t } };
    }

    std::tm toTm(TimePoint t) {
      const auto raw = static_cast<std::time_t>(t.time_since_epoch().count());
      std::tm tm{};
      ::gmtime_r(&raw, &tm);
      return tm;
    }

  } // namespace

  std::string toIso(TimePoint t) {
    const std::tm tm = toTm(t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
  }

  TimePoint parseIso(const std::string& text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    const int n = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d", &y, &mo, &d, &h, &mi, &s);
    if (n != 5 && n != 6)
      throw ScheduleError(ErrorCode::InvalidArgument, "[TimeUtil] bad ISO-8601 time: " + text);
    return fromFields(y, mo, d, h, mi, s, text);
  }

  TimePoint atTimeOfDay(const std::string& date, const std::string& hhmm) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0;
    if (std::sscanf(date.c_str(), "%4d-%2d-%2d", &y, &mo, &d) != 3)
      throw ScheduleError(ErrorCode::InvalidArgument, "[TimeUtil] bad date: " + date);
    if (std::sscanf(hhmm.c_str(), "%2d:%2d", &h, &mi) != 2)
      throw ScheduleError(ErrorCode::InvalidArgument, "[TimeUtil] bad time of day: " + hhmm);
    return fromFields(y, mo, d, h, mi, 0, date + " " + hhmm);
  }

} // namespace rollstart::core
