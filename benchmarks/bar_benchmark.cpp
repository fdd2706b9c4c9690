/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "tradelib/bar/bar.h"
#include "tradelib/bar/bars.h"
#include "tradelib/bar/frequency.h"
#include "tradelib/log/log_stream.h"
#include "tradelib/session/session_annotator.h"

#include <algorithm>
#include <benchmark/benchmark.h>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace tradelib;

namespace
{

const TimePoint kStart = fromUnixNanos(1294047000LL * kNsPerSec);

}  // namespace

// =============================================================================
// Bar construction
// =============================================================================

static void BM_Bar_ConstructValid(benchmark::State& state)
{
  std::mt19937 rng(42);
  std::uniform_real_distribution<> priceDist(100.0, 110.0);

  for (auto _ : state)
  {
    double open = priceDist(rng);
    double close = priceDist(rng);
    Bar bar(kStart, open, std::max(open, close) + 0.5, std::min(open, close) - 0.5, close, 1000,
            close);
    benchmark::DoNotOptimize(bar);
  }
}
BENCHMARK(BM_Bar_ConstructValid);

static void BM_Bar_ConstructInvalid(benchmark::State& state)
{
  for (auto _ : state)
  {
    try
    {
      Bar bar(kStart, 20.0, 10.0, 5.0, 1.0, 1000, 1.0);
      benchmark::DoNotOptimize(bar);
    }
    catch (const InvariantViolation& e)
    {
      benchmark::DoNotOptimize(e.violations().size());
    }
  }
}
BENCHMARK(BM_Bar_ConstructInvalid);

static void BM_Bar_AdjustedPrices(benchmark::State& state)
{
  Bar bar(kStart, 40.0, 44.0, 38.0, 42.0, 1000, 21.0);
  for (auto _ : state)
  {
    benchmark::DoNotOptimize(bar.adjOpen() + bar.adjHigh() + bar.adjLow());
  }
}
BENCHMARK(BM_Bar_AdjustedPrices);

// =============================================================================
// Bars cross-sections
// =============================================================================

static void BM_Bars_Construct(benchmark::State& state)
{
  const auto numSymbols = static_cast<size_t>(state.range(0));

  BarMap map;
  for (size_t i = 0; i < numSymbols; ++i)
  {
    map.emplace("SYM" + std::to_string(i),
                std::make_shared<Bar>(kStart, 10.0, 11.0, 9.0, 10.5, 100, 10.5));
  }

  for (auto _ : state)
  {
    Bars bars(map);
    benchmark::DoNotOptimize(bars.dateTime());
  }
}
BENCHMARK(BM_Bars_Construct)->Arg(10)->Arg(100)->Arg(1000);

static void BM_Bars_Lookup(benchmark::State& state)
{
  BarMap map;
  std::vector<std::string> symbols;
  for (size_t i = 0; i < 500; ++i)
  {
    symbols.push_back("SYM" + std::to_string(i));
    map.emplace(symbols.back(), std::make_shared<Bar>(kStart, 10.0, 11.0, 9.0, 10.5, 100, 10.5));
  }
  Bars bars(std::move(map));

  std::mt19937 rng(42);
  std::uniform_int_distribution<size_t> symDist(0, symbols.size() - 1);

  for (auto _ : state)
  {
    benchmark::DoNotOptimize(bars.getBar(symbols[symDist(rng)]));
  }
}
BENCHMARK(BM_Bars_Lookup);

// =============================================================================
// Session annotation / frequency lookup
// =============================================================================

static void BM_SessionAnnotator_MinuteBars(benchmark::State& state)
{
  const auto days = static_cast<size_t>(state.range(0));
  constexpr size_t kBarsPerDay = 390;

  std::vector<std::shared_ptr<Bar>> bars;
  bars.reserve(days * kBarsPerDay);
  for (size_t d = 0; d < days; ++d)
  {
    for (size_t m = 0; m < kBarsPerDay; ++m)
    {
      auto ts = kStart + std::chrono::hours(24 * d) + std::chrono::minutes(m);
      bars.push_back(std::make_shared<Bar>(ts, 10.0, 11.0, 9.0, 10.5, 100, 10.5));
    }
  }

  setLogLevel(LogLevel::Warn);
  SessionAnnotator annotator;
  for (auto _ : state)
  {
    benchmark::DoNotOptimize(annotator.annotate(bars));
  }
  state.SetItemsProcessed(state.iterations() * bars.size());
}
BENCHMARK(BM_SessionAnnotator_MinuteBars)->Arg(1)->Arg(20)->Arg(250);

static void BM_Frequency_Parse(benchmark::State& state)
{
  const auto all = allFrequencies();
  size_t i = 0;
  for (auto _ : state)
  {
    benchmark::DoNotOptimize(parseFrequency(frequencyName(all[i++ % all.size()])));
  }
}
BENCHMARK(BM_Frequency_Parse);

BENCHMARK_MAIN();
