/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "tradelib/bar/bar.h"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace tradelib
{

Bar::Bar(TimePoint dateTime, Price open, Price high, Price low, Price close, Volume volume,
         Price adjClose)
    : _dateTime(dateTime),
      _open(open),
      _high(high),
      _low(low),
      _close(close),
      _volume(volume),
      _adjClose(adjClose)
{
  auto violations = check(open, high, low, close);
  if (!violations.empty())
  {
    throw InvariantViolation(std::move(violations), toString());
  }
}

std::vector<BarRule> Bar::check(Price open, Price high, Price low, Price close)
{
  std::vector<BarRule> violations;

  auto require = [&violations](bool ok, BarRule rule)
  {
    if (!ok)
    {
      violations.push_back(rule);
    }
  };

  require(high >= open, BarRule::HighGeOpen);
  require(high >= low, BarRule::HighGeLow);
  require(high >= close, BarRule::HighGeClose);
  require(low <= open, BarRule::LowLeOpen);
  require(low <= high, BarRule::LowLeHigh);
  require(low <= close, BarRule::LowLeClose);

  return violations;
}

double Bar::adjustmentRatio() const
{
  if (_close == 0.0)
  {
    throw UndefinedAdjustment(toString());
  }
  return _adjClose / _close;
}

Price Bar::adjusted(Price raw) const
{
  if (_close == 0.0)
  {
    throw UndefinedAdjustment(toString());
  }
  return _adjClose * raw / _close;
}

Price Bar::adjOpen() const { return adjusted(_open); }
Price Bar::adjHigh() const { return adjusted(_high); }
Price Bar::adjLow() const { return adjusted(_low); }

void Bar::setSessionClose(bool sessionClose) noexcept
{
  _sessionClose = sessionClose;
  if (sessionClose)
  {
    _barsUntilSessionClose = 0;
  }
}

void Bar::setBarsUntilSessionClose(std::optional<uint32_t> bars) noexcept
{
  _barsUntilSessionClose = bars;
}

std::string Bar::toString() const
{
  // Volume is shown truncated toward zero, without going through an integer type.
  Volume volume = std::trunc(_volume);
  if (volume == 0.0)
  {
    volume = 0.0;
  }

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << "DT: " << formatMinutes(_dateTime)
      << ", O: " << _open << ", H: " << _high << ", L: " << _low << ", C: " << _close
      << ", V: " << std::setprecision(0) << volume;
  return oss.str();
}

bool Bar::operator==(const Bar& other) const noexcept
{
  return _dateTime == other._dateTime && _open == other._open && _high == other._high &&
         _low == other._low && _close == other._close && _volume == other._volume &&
         _adjClose == other._adjClose;
}

std::ostream& operator<<(std::ostream& os, const Bar& bar)
{
  return os << bar.toString();
}

}  // namespace tradelib
