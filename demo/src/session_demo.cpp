/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

// Session annotation demo
//
// Builds minute bars for two symbols from inline rows, skips rows that break the OHLC
// ordering rules, groups the rest into synchronized snapshots and marks the last bar
// of each trading day.

#include "tradelib/bar/bar.h"
#include "tradelib/bar/bars.h"
#include "tradelib/bar/frequency.h"
#include "tradelib/config/session_config.h"
#include "tradelib/log/log.h"
#include "tradelib/session/session_annotator.h"

#include <iostream>
#include <map>
#include <memory>
#include <vector>

using namespace tradelib;

struct Row
{
  const char* symbol;
  const char* dateTime;
  double open, high, low, close, volume, adjClose;
};

static const Row kRows[] = {
    {"AAPL", "2011-01-03 15:58", 329.10, 329.50, 328.90, 329.40, 120000, 47.01},
    {"MSFT", "2011-01-03 15:58", 27.95, 28.00, 27.90, 27.98, 310000, 23.41},
    {"AAPL", "2011-01-03 15:59", 329.40, 329.60, 329.20, 329.57, 180000, 47.03},
    {"MSFT", "2011-01-03 15:59", 27.98, 28.01, 27.96, 27.99, 420000, 23.42},
    {"AAPL", "2011-01-04 09:30", 331.27, 331.50, 330.90, 331.10, 250000, 47.25},
    // high below open: rejected by the ingestion step
    {"MSFT", "2011-01-04 09:30", 28.10, 27.90, 27.80, 27.85, 510000, 23.30},
    {"AAPL", "2011-01-04 09:31", 331.10, 331.40, 331.00, 331.35, 140000, 47.28},
    {"MSFT", "2011-01-04 09:31", 27.86, 27.95, 27.84, 27.93, 260000, 23.37},
};

int main()
{
  SessionConfig config;
  if (auto level = parseLogLevel(config.logLevel))
  {
    setLogLevel(*level);
  }

  const Frequency freq = parseFrequency("minute");
  TRADELIB_LOG_INFO("Loading " << freq << " bars");

  std::map<TimePoint, BarMap> byTime;
  for (const Row& row : kRows)
  {
    auto ts = parseDateTime(row.dateTime);
    if (!ts)
    {
      TRADELIB_LOG_WARN("Skipping " << row.symbol << ": bad timestamp '" << row.dateTime << "'");
      continue;
    }

    try
    {
      byTime[*ts].emplace(row.symbol,
                          std::make_shared<Bar>(*ts, row.open, row.high, row.low, row.close,
                                                row.volume, row.adjClose));
    }
    catch (const InvariantViolation& e)
    {
      TRADELIB_LOG_WARN("Skipping " << row.symbol << ":\n" << e.what());
    }
  }

  std::vector<Bars> snapshots;
  for (auto& [ts, bars] : byTime)
  {
    snapshots.emplace_back(std::move(bars));
  }

  SessionAnnotator annotator(config);
  const size_t sessions = annotator.annotate(snapshots);

  std::cout << snapshots.size() << " snapshots, " << sessions << " sessions\n";
  for (const Bars& snapshot : snapshots)
  {
    for (const auto& symbol : snapshot.symbols())
    {
      const Bar& bar = snapshot[symbol];
      std::cout << symbol << "  " << bar << "  adjO=" << bar.adjOpen()
                << "  left=" << bar.barsUntilSessionClose().value_or(0)
                << (bar.sessionClose() ? "  [session close]" : "") << '\n';
    }
  }

  return 0;
}
