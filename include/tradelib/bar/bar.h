/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "tradelib/bar/errors.h"
#include "tradelib/common.h"
#include "tradelib/util/base/time.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tradelib
{

/**
 * A symbol's prices at one point in time.
 *
 * Price and volume fields are fixed at construction. Only the session fields can
 * change afterwards; they are filled in by a session scan once the whole session
 * is known (see SessionAnnotator).
 */
class Bar
{
 public:
  /// Throws InvariantViolation listing every broken OHLC ordering rule.
  Bar(TimePoint dateTime, Price open, Price high, Price low, Price close, Volume volume,
      Price adjClose);

  /// Broken OHLC ordering rules for the given prices, in reporting order. Empty when the
  /// prices form a valid bar.
  static std::vector<BarRule> check(Price open, Price high, Price low, Price close);

  TimePoint dateTime() const noexcept { return _dateTime; }
  Price open() const noexcept { return _open; }
  Price high() const noexcept { return _high; }
  Price low() const noexcept { return _low; }
  Price close() const noexcept { return _close; }
  Volume volume() const noexcept { return _volume; }
  Price adjClose() const noexcept { return _adjClose; }

  /// adjClose / close. Throws UndefinedAdjustment when close is zero.
  double adjustmentRatio() const;

  Price adjOpen() const;
  Price adjHigh() const;
  Price adjLow() const;

  bool sessionClose() const noexcept { return _sessionClose; }
  std::optional<uint32_t> barsUntilSessionClose() const noexcept { return _barsUntilSessionClose; }

  // Marking a bar as session close also zeroes the countdown.
  void setSessionClose(bool sessionClose) noexcept;
  void setBarsUntilSessionClose(std::optional<uint32_t> bars) noexcept;

  std::string toString() const;

  // Session fields do not take part in equality.
  bool operator==(const Bar& other) const noexcept;
  bool operator!=(const Bar& other) const noexcept { return !(*this == other); }

 private:
  Price adjusted(Price raw) const;

  TimePoint _dateTime;
  Price _open;
  Price _high;
  Price _low;
  Price _close;
  Volume _volume;
  Price _adjClose;

  bool _sessionClose{false};
  std::optional<uint32_t> _barsUntilSessionClose;
};

std::ostream& operator<<(std::ostream& os, const Bar& bar);

}  // namespace tradelib
