/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <optional>
#include <string_view>

namespace tradelib
{

enum class LogLevel
{
  Info,
  Warn,
  Error
};

std::string_view logLevelName(LogLevel level) noexcept;

// "info", "warn"/"warning", "error"; nullopt otherwise.
std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept;

struct ILogger
{
  virtual ~ILogger() = default;

  virtual void info(std::string_view msg) = 0;
  virtual void warn(std::string_view msg) = 0;
  virtual void error(std::string_view msg) = 0;
};

}  // namespace tradelib
