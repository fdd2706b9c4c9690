/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "tradelib/log/console_logger.h"

#include <cstdio>

namespace tradelib
{

std::string_view logLevelName(LogLevel level) noexcept
{
  switch (level)
  {
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept
{
  if (name == "info")
  {
    return LogLevel::Info;
  }
  if (name == "warn" || name == "warning")
  {
    return LogLevel::Warn;
  }
  if (name == "error")
  {
    return LogLevel::Error;
  }
  return std::nullopt;
}

ConsoleLogger::ConsoleLogger(LogLevel minLevel) : _minLevel(minLevel) {}

void ConsoleLogger::log(LogLevel level, std::string_view msg)
{
  std::scoped_lock lock(_mutex);
  if (level < _minLevel)
  {
    return;
  }

  std::FILE* out = level == LogLevel::Info ? stdout : stderr;
  auto name = logLevelName(level);
  std::fprintf(out, "[%.*s] %.*s\n", static_cast<int>(name.size()), name.data(),
               static_cast<int>(msg.size()), msg.data());
  std::fflush(out);
}

void ConsoleLogger::info(std::string_view msg) { log(LogLevel::Info, msg); }
void ConsoleLogger::warn(std::string_view msg) { log(LogLevel::Warn, msg); }
void ConsoleLogger::error(std::string_view msg) { log(LogLevel::Error, msg); }

void ConsoleLogger::setMinLevel(LogLevel level)
{
  std::scoped_lock lock(_mutex);
  _minLevel = level;
}

LogLevel ConsoleLogger::minLevel() const
{
  std::scoped_lock lock(_mutex);
  return _minLevel;
}

}  // namespace tradelib
