/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "tradelib/util/base/time.h"

#include <gtest/gtest.h>
#include <chrono>

using namespace tradelib;

TEST(TimeUtilsTest, ParsesDateAndDateTime)
{
  auto date = parseDateTime("2011-01-03");
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(toUnixNanos(*date), 1294012800LL * kNsPerSec);

  auto minute = parseDateTime("2011-01-03 09:30");
  ASSERT_TRUE(minute.has_value());
  EXPECT_EQ(toUnixNanos(*minute) - toUnixNanos(*date), (9 * 60 + 30) * kNsPerMin);

  auto seconds = parseDateTime("2011-01-03T09:30:15");
  ASSERT_TRUE(seconds.has_value());
  EXPECT_EQ(toUnixNanos(*seconds) - toUnixNanos(*minute), 15 * kNsPerSec);
}

TEST(TimeUtilsTest, RejectsMalformedInput)
{
  EXPECT_FALSE(parseDateTime("").has_value());
  EXPECT_FALSE(parseDateTime("2011/01/03").has_value());
  EXPECT_FALSE(parseDateTime("2011-13-03").has_value());
  EXPECT_FALSE(parseDateTime("2011-01-03 25:00").has_value());
  EXPECT_FALSE(parseDateTime("2011-01-03 09:30 extra").has_value());
}

TEST(TimeUtilsTest, FormatsToMinutePrecision)
{
  auto tp = parseDateTime("2011-01-03 09:30:59");
  ASSERT_TRUE(tp.has_value());
  EXPECT_EQ(formatMinutes(*tp), "2011.01.03 09:30");
  EXPECT_EQ(formatIso(*tp), "2011-01-03T09:30:59");
}

TEST(TimeUtilsTest, UnixNanosRoundTrip)
{
  constexpr UnixNanos ns = 1294047000LL * kNsPerSec + 123;
  EXPECT_EQ(toUnixNanos(fromUnixNanos(ns)), ns);
}

TEST(TimeUtilsTest, IsoFormatKeepsSubSecondPart)
{
  auto tp = parseDateTime("2011-01-03 09:30:15");
  ASSERT_TRUE(tp.has_value());

  EXPECT_EQ(formatIso(*tp + std::chrono::nanoseconds(500)), "2011-01-03T09:30:15.000000500");
  EXPECT_EQ(formatIso(*tp + std::chrono::milliseconds(250)), "2011-01-03T09:30:15.250000000");
  EXPECT_EQ(formatMinutes(*tp + std::chrono::milliseconds(250)), "2011.01.03 09:30");
}

TEST(TimeUtilsTest, IsoFormatBeforeEpoch)
{
  EXPECT_EQ(formatIso(fromUnixNanos(-1)), "1969-12-31T23:59:59.999999999");
}
