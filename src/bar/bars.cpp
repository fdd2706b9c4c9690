/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "tradelib/bar/bars.h"

#include <stdexcept>
#include <utility>

namespace tradelib
{

Bars::Bars(BarMap bars) : _bars(std::move(bars))
{
  if (_bars.empty())
  {
    throw EmptyInput();
  }

  for (const auto& [symbol, bar] : _bars)
  {
    if (!bar)
    {
      throw std::invalid_argument("Null bar supplied for symbol: " + symbol);
    }
  }

  // Every bar is compared against one reference, so the outcome does not depend on
  // which entry comes first.
  const auto& [refSymbol, refBar] = *_bars.begin();
  for (const auto& [symbol, bar] : _bars)
  {
    if (bar->dateTime() != refBar->dateTime())
    {
      throw DesynchronizedTimestamps(symbol, bar->dateTime(), refSymbol, refBar->dateTime());
    }
  }

  _dateTime = refBar->dateTime();
}

const Bar& Bars::operator[](std::string_view symbol) const
{
  auto it = _bars.find(symbol);
  if (it == _bars.end())
  {
    throw MissingSymbol(std::string(symbol));
  }
  return *it->second;
}

const Bar* Bars::getBar(std::string_view symbol) const noexcept
{
  auto it = _bars.find(symbol);
  return it != _bars.end() ? it->second.get() : nullptr;
}

bool Bars::contains(std::string_view symbol) const noexcept
{
  return _bars.find(symbol) != _bars.end();
}

std::vector<std::string> Bars::symbols() const
{
  std::vector<std::string> out;
  out.reserve(_bars.size());
  for (const auto& [symbol, bar] : _bars)
  {
    out.push_back(symbol);
  }
  return out;
}

}  // namespace tradelib
