/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "tradelib/log/log_stream.h"
#include "tradelib/log/console_logger.h"

namespace tradelib
{

ConsoleLogger& consoleLogger()
{
  static ConsoleLogger logger;
  return logger;
}

void setLogLevel(LogLevel level)
{
  consoleLogger().setMinLevel(level);
}

LogStream::LogStream(LogLevel level) : _level(level) {}

LogStream::~LogStream()
{
  consoleLogger().log(_level, _stream.str());
}

}  // namespace tradelib
