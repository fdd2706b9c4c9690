/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "tradelib/bar/bar.h"
#include "tradelib/util/base/time.h"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tradelib
{

using BarMap = std::map<std::string, std::shared_ptr<Bar>, std::less<>>;

/**
 * One bar per symbol, all at the same timestamp.
 *
 * The Bar objects are shared with whoever built the map: session fields set later
 * through another handle are visible here. The symbol set and timestamp never change.
 */
class Bars
{
 public:
  using const_iterator = BarMap::const_iterator;

  /// Throws EmptyInput for an empty map, std::invalid_argument for a null entry and
  /// DesynchronizedTimestamps when two bars disagree on their timestamp.
  explicit Bars(BarMap bars);

  /// Throws MissingSymbol when the symbol is absent.
  const Bar& operator[](std::string_view symbol) const;

  /// nullptr when the symbol is absent.
  const Bar* getBar(std::string_view symbol) const noexcept;

  bool contains(std::string_view symbol) const noexcept;

  std::vector<std::string> symbols() const;

  TimePoint dateTime() const noexcept { return _dateTime; }

  size_t size() const noexcept { return _bars.size(); }

  const_iterator begin() const noexcept { return _bars.begin(); }
  const_iterator end() const noexcept { return _bars.end(); }

 private:
  BarMap _bars;
  TimePoint _dateTime{};
};

}  // namespace tradelib
