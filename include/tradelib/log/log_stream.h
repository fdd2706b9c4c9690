/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <sstream>

#include "tradelib/log/abstract_logger.h"

namespace tradelib
{

class ConsoleLogger;

// Process-wide logger behind the TRADELIB_LOG_* macros.
ConsoleLogger& consoleLogger();

void setLogLevel(LogLevel level);

class LogStream
{
 public:
  explicit LogStream(LogLevel level = LogLevel::Info);
  ~LogStream();

  template <typename T>
  LogStream& operator<<(const T& val)
  {
    _stream << val;
    return *this;
  }

 private:
  LogLevel _level;
  std::ostringstream _stream;
};

}  // namespace tradelib
