/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

namespace tradelib
{

using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;
using UnixNanos = int64_t;

inline constexpr int64_t kNsPerSec = 1'000'000'000LL;
inline constexpr int64_t kNsPerMin = 60LL * kNsPerSec;
inline constexpr int64_t kNsPerDay = 24LL * 60LL * kNsPerMin;

inline UnixNanos toUnixNanos(TimePoint tp)
{
  return tp.time_since_epoch().count();
}

inline TimePoint fromUnixNanos(UnixNanos ns)
{
  return TimePoint(std::chrono::nanoseconds(ns));
}

namespace detail
{

// Calendar fields of the time point as stored. No zone conversion is applied.
inline std::tm calendarFields(TimePoint tp)
{
  auto ns = toUnixNanos(tp);
  auto secs = ns / kNsPerSec;
  if (ns % kNsPerSec < 0)
  {
    --secs;
  }
  std::time_t t = static_cast<std::time_t>(secs);

  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  return tm;
}

inline std::string format(TimePoint tp, const char* pattern)
{
  std::tm tm = calendarFields(tp);
  std::ostringstream oss;
  oss << std::put_time(&tm, pattern);
  return oss.str();
}

}  // namespace detail

// "2011.01.03 09:30"
inline std::string formatMinutes(TimePoint tp)
{
  return detail::format(tp, "%Y.%m.%d %H:%M");
}

// "2011-01-03T09:30:00", or "2011-01-03T09:30:00.000000500" when there is a sub-second part
inline std::string formatIso(TimePoint tp)
{
  std::string out = detail::format(tp, "%Y-%m-%dT%H:%M:%S");

  int64_t fracNs = toUnixNanos(tp) % kNsPerSec;
  if (fracNs < 0)
  {
    fracNs += kNsPerSec;
  }
  if (fracNs > 0)
  {
    std::ostringstream oss;
    oss << '.' << std::setfill('0') << std::setw(9) << fracNs;
    out += oss.str();
  }
  return out;
}

// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM" and "YYYY-MM-DD HH:MM:SS" ('T' separator also
// allowed).
inline std::optional<TimePoint> parseDateTime(std::string_view str)
{
  if (str.empty())
  {
    return std::nullopt;
  }

  static const std::regex dt_regex(
      R"((\d{4})-(\d{2})-(\d{2}))"
      R"((?:[T ](\d{2}):(\d{2})(?::(\d{2}))?)?)");

  std::string input(str);
  std::smatch match;
  if (!std::regex_match(input, match, dt_regex))
  {
    return std::nullopt;
  }

  std::tm tm{};
  tm.tm_year = std::stoi(match[1].str()) - 1900;
  tm.tm_mon = std::stoi(match[2].str()) - 1;
  tm.tm_mday = std::stoi(match[3].str());

  if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31)
  {
    return std::nullopt;
  }

  if (match[4].matched)
  {
    tm.tm_hour = std::stoi(match[4].str());
    tm.tm_min = std::stoi(match[5].str());
    if (match[6].matched)
    {
      tm.tm_sec = std::stoi(match[6].str());
    }
  }

  if (tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59)
  {
    return std::nullopt;
  }

  tm.tm_isdst = 0;
#ifdef _WIN32
  std::time_t epoch = _mkgmtime(&tm);
#else
  std::time_t epoch = timegm(&tm);
#endif

  return fromUnixNanos(static_cast<int64_t>(epoch) * kNsPerSec);
}

}  // namespace tradelib
