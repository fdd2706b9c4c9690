/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "tradelib/bar/bars.h"

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tradelib;

namespace
{

TimePoint at(const char* dt)
{
  auto tp = parseDateTime(dt);
  EXPECT_TRUE(tp.has_value()) << dt;
  return tp.value_or(TimePoint{});
}

std::shared_ptr<Bar> makeBar(TimePoint ts, double close)
{
  return std::make_shared<Bar>(ts, close, close + 1.0, close - 1.0, close, 1000, close);
}

}  // namespace

TEST(BarsTest, EmptyMapThrows)
{
  EXPECT_THROW(Bars(BarMap{}), EmptyInput);
  EXPECT_THROW(Bars(BarMap{}), std::invalid_argument);
}

TEST(BarsTest, NullEntryThrows)
{
  BarMap map{{"AAPL", makeBar(at("2011-01-03 10:00"), 330.0)}, {"MSFT", nullptr}};
  EXPECT_THROW(Bars{std::move(map)}, std::invalid_argument);
}

TEST(BarsTest, DesynchronizedTimestampsNameBothSymbols)
{
  auto aapl = makeBar(at("2011-01-03 10:00"), 330.0);
  auto msft = makeBar(at("2011-01-03 10:01"), 28.0);

  try
  {
    Bars bars(BarMap{{"AAPL", aapl}, {"MSFT", msft}});
    FAIL() << "expected DesynchronizedTimestamps";
  }
  catch (const DesynchronizedTimestamps& e)
  {
    EXPECT_EQ(e.referenceSymbol(), "AAPL");
    EXPECT_EQ(e.referenceTime(), aapl->dateTime());
    EXPECT_EQ(e.symbol(), "MSFT");
    EXPECT_EQ(e.time(), msft->dateTime());

    std::string msg = e.what();
    EXPECT_NE(msg.find("AAPL"), std::string::npos);
    EXPECT_NE(msg.find("MSFT"), std::string::npos);
    EXPECT_NE(msg.find("2011-01-03T10:00:00"), std::string::npos);
    EXPECT_NE(msg.find("2011-01-03T10:01:00"), std::string::npos);
  }
}

TEST(BarsTest, MismatchDetectedRegardlessOfPosition)
{
  auto ts = at("2011-01-03 10:00");
  BarMap map{{"AAPL", makeBar(ts, 330.0)},
             {"GOOG", makeBar(ts, 600.0)},
             {"MSFT", makeBar(ts, 28.0)},
             {"ZNGA", makeBar(at("2011-01-03 09:59"), 10.0)}};

  EXPECT_THROW(Bars{std::move(map)}, DesynchronizedTimestamps);
}

TEST(BarsTest, SynchronizedBarsAreAccessible)
{
  auto ts = at("2011-01-03 10:00");
  auto aapl = makeBar(ts, 330.0);
  auto msft = makeBar(ts, 28.0);

  Bars bars(BarMap{{"AAPL", aapl}, {"MSFT", msft}});

  EXPECT_EQ(bars.dateTime(), aapl->dateTime());
  EXPECT_EQ(bars.size(), 2u);
  EXPECT_EQ(bars["AAPL"], *aapl);
  EXPECT_EQ(bars["MSFT"], *msft);

  EXPECT_TRUE(bars.contains("AAPL"));
  EXPECT_FALSE(bars.contains("GOOG"));

  EXPECT_EQ(bars.getBar("MSFT"), msft.get());
  EXPECT_EQ(bars.getBar("GOOG"), nullptr);

  EXPECT_THROW(bars["GOOG"], MissingSymbol);
  EXPECT_THROW(bars["GOOG"], std::out_of_range);

  std::vector<std::string> expected{"AAPL", "MSFT"};
  EXPECT_EQ(bars.symbols(), expected);
}

TEST(BarsTest, MissingSymbolCarriesName)
{
  auto ts = at("2011-01-03 10:00");
  Bars bars(BarMap{{"AAPL", makeBar(ts, 330.0)}});

  try
  {
    (void)bars["GOOG"];
    FAIL() << "expected MissingSymbol";
  }
  catch (const MissingSymbol& e)
  {
    EXPECT_EQ(e.symbol(), "GOOG");
  }
}

TEST(BarsTest, SingleBarIsValid)
{
  auto ts = at("2011-01-03 16:00");
  Bars bars(BarMap{{"SPY", makeBar(ts, 127.0)}});
  EXPECT_EQ(bars.dateTime(), ts);
  EXPECT_EQ(bars.symbols(), std::vector<std::string>{"SPY"});
}

TEST(BarsTest, SessionChangesAreVisibleThroughSharedBars)
{
  auto ts = at("2011-01-03 16:00");
  auto aapl = makeBar(ts, 330.0);
  Bars bars(BarMap{{"AAPL", aapl}});

  ASSERT_FALSE(bars["AAPL"].sessionClose());
  aapl->setSessionClose(true);
  EXPECT_TRUE(bars["AAPL"].sessionClose());
  EXPECT_EQ(bars.getBar("AAPL")->barsUntilSessionClose(), 0u);
}

TEST(BarsTest, IteratesEveryEntry)
{
  auto ts = at("2011-01-03 10:00");
  Bars bars(BarMap{{"AAPL", makeBar(ts, 330.0)}, {"MSFT", makeBar(ts, 28.0)}});

  size_t n = 0;
  for (const auto& [symbol, bar] : bars)
  {
    EXPECT_TRUE(bars.contains(symbol));
    EXPECT_EQ(bar->dateTime(), ts);
    ++n;
  }
  EXPECT_EQ(n, bars.size());
}

TEST(BarsTest, SubSecondMismatchShowsBothTimestamps)
{
  auto ts = at("2011-01-03 10:00");
  auto aapl = makeBar(ts, 330.0);
  auto msft = makeBar(ts + std::chrono::nanoseconds(500), 28.0);

  try
  {
    Bars bars(BarMap{{"AAPL", aapl}, {"MSFT", msft}});
    FAIL() << "expected DesynchronizedTimestamps";
  }
  catch (const DesynchronizedTimestamps& e)
  {
    std::string msg = e.what();
    EXPECT_NE(msg.find("MSFT 2011-01-03T10:00:00.000000500"), std::string::npos);
    EXPECT_NE(msg.find("AAPL 2011-01-03T10:00:00"), std::string::npos);
    EXPECT_EQ(msg.find("AAPL 2011-01-03T10:00:00."), std::string::npos);
  }
}
