/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "tradelib/session/session_annotator.h"
#include "tradelib/log/log.h"

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tradelib
{

namespace
{

int64_t floorDiv(int64_t a, int64_t b)
{
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0)))
  {
    --q;
  }
  return q;
}

}  // namespace

SessionAnnotator::SessionAnnotator(SessionConfig config) : _config(std::move(config)) {}

int64_t SessionAnnotator::sessionDay(TimePoint tp) const noexcept
{
  const int64_t offsetNs = static_cast<int64_t>(_config.sessionStartOffset.count()) * kNsPerMin;
  return floorDiv(toUnixNanos(tp) - offsetNs, kNsPerDay);
}

size_t SessionAnnotator::annotate(std::span<const std::shared_ptr<Bar>> bars) const
{
  const size_t sessions = annotateSeries(bars);
  TRADELIB_LOG_INFO("[SessionAnnotator] annotated " << bars.size() << " bars, " << sessions
                                                    << " sessions");
  return sessions;
}

size_t SessionAnnotator::annotateSeries(std::span<const std::shared_ptr<Bar>> bars) const
{
  for (size_t i = 0; i < bars.size(); ++i)
  {
    if (!bars[i])
    {
      throw std::invalid_argument("Null bar at index " + std::to_string(i));
    }
    if (i > 0 && bars[i]->dateTime() < bars[i - 1]->dateTime())
    {
      throw std::invalid_argument("Bars are not in chronological order at index " +
                                  std::to_string(i) + ": " + formatIso(bars[i]->dateTime()) +
                                  " < " + formatIso(bars[i - 1]->dateTime()));
    }
  }

  size_t sessions = 0;
  uint32_t remaining = 0;
  for (size_t i = bars.size(); i-- > 0;)
  {
    Bar& bar = *bars[i];
    const bool last =
        i + 1 == bars.size() || sessionDay(bars[i + 1]->dateTime()) != sessionDay(bar.dateTime());
    if (last)
    {
      ++sessions;
      remaining = 0;
      bar.setSessionClose(true);
    }
    else
    {
      ++remaining;
      bar.setSessionClose(false);
      bar.setBarsUntilSessionClose(remaining);
    }
  }

  return sessions;
}

size_t SessionAnnotator::annotate(std::span<const Bars> snapshots) const
{
  std::map<std::string, std::vector<std::shared_ptr<Bar>>, std::less<>> bySymbol;
  size_t sessions = 0;

  for (size_t i = 0; i < snapshots.size(); ++i)
  {
    const Bars& snapshot = snapshots[i];
    if (i > 0 && snapshot.dateTime() < snapshots[i - 1].dateTime())
    {
      throw std::invalid_argument("Snapshots are not in chronological order at index " +
                                  std::to_string(i) + ": " + formatIso(snapshot.dateTime()) +
                                  " < " + formatIso(snapshots[i - 1].dateTime()));
    }
    if (i == 0 || sessionDay(snapshot.dateTime()) != sessionDay(snapshots[i - 1].dateTime()))
    {
      ++sessions;
    }
    for (const auto& [symbol, bar] : snapshot)
    {
      bySymbol[symbol].push_back(bar);
    }
  }

  for (const auto& [symbol, series] : bySymbol)
  {
    annotateSeries(series);
  }

  TRADELIB_LOG_INFO("[SessionAnnotator] annotated " << snapshots.size() << " snapshots, "
                                                    << bySymbol.size() << " symbols, "
                                                    << sessions << " sessions");
  return sessions;
}

}  // namespace tradelib
