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
#include <string>

namespace tradelib
{

#ifndef TRADELIB_DEFAULT_SESSION_START_OFFSET_MIN
#define TRADELIB_DEFAULT_SESSION_START_OFFSET_MIN 0
#endif

namespace config
{

/// Minutes after midnight at which a trading day begins.
inline constexpr int64_t DEFAULT_SESSION_START_OFFSET_MIN = TRADELIB_DEFAULT_SESSION_START_OFFSET_MIN;

static_assert(DEFAULT_SESSION_START_OFFSET_MIN >= 0 && DEFAULT_SESSION_START_OFFSET_MIN < 24 * 60,
              "Session start offset must fall within one day");

}  // namespace config

struct SessionConfig
{
  // Bars at or after this offset from midnight belong to that day's session; earlier bars
  // belong to the previous day's. Plain offset, no zone rules.
  std::chrono::minutes sessionStartOffset{config::DEFAULT_SESSION_START_OFFSET_MIN};

  std::string logLevel = "info";
};

}  // namespace tradelib
