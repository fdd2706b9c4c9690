/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <mutex>
#include <string_view>

#include "tradelib/log/abstract_logger.h"

namespace tradelib
{

class ConsoleLogger final : public ILogger
{
 public:
  explicit ConsoleLogger(LogLevel minLevel = LogLevel::Info);

  void log(LogLevel level, std::string_view msg);
  void info(std::string_view msg) override;
  void warn(std::string_view msg) override;
  void error(std::string_view msg) override;

  void setMinLevel(LogLevel level);
  LogLevel minLevel() const;

 private:
  mutable std::mutex _mutex;
  LogLevel _minLevel;
};

}  // namespace tradelib
