/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "tradelib/log/log_stream.h"

#ifndef TRADELIB_DISABLE_LOGGING

#define TRADELIB_LOG_INFO(expr) ::tradelib::LogStream(::tradelib::LogLevel::Info) << expr
#define TRADELIB_LOG_WARN(expr) ::tradelib::LogStream(::tradelib::LogLevel::Warn) << expr
#define TRADELIB_LOG_ERROR(expr) ::tradelib::LogStream(::tradelib::LogLevel::Error) << expr

#else

#define TRADELIB_LOG_INFO(expr) \
  do                            \
  {                             \
  } while (0)
#define TRADELIB_LOG_WARN(expr) \
  do                            \
  {                             \
  } while (0)
#define TRADELIB_LOG_ERROR(expr) \
  do                             \
  {                              \
  } while (0)

#endif
