/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "tradelib/util/base/time.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tradelib
{

// OHLC ordering rules, in the order they are checked and reported.
enum class BarRule : uint8_t
{
  HighGeOpen,
  HighGeLow,
  HighGeClose,
  LowLeOpen,
  LowLeHigh,
  LowLeClose
};

std::string_view barRuleMessage(BarRule rule) noexcept;

// One or more OHLC ordering rules broken while constructing a Bar.
class InvariantViolation : public std::invalid_argument
{
 public:
  InvariantViolation(std::vector<BarRule> violations, std::string barText);

  const std::vector<BarRule>& violations() const noexcept { return _violations; }
  const std::string& barText() const noexcept { return _barText; }

 private:
  std::vector<BarRule> _violations;
  std::string _barText;
};

class EmptyInput : public std::invalid_argument
{
 public:
  EmptyInput();
};

// Two bars of one cross-section disagree on their timestamp.
class DesynchronizedTimestamps : public std::invalid_argument
{
 public:
  DesynchronizedTimestamps(std::string symbol, TimePoint time, std::string referenceSymbol,
                           TimePoint referenceTime);

  const std::string& symbol() const noexcept { return _symbol; }
  TimePoint time() const noexcept { return _time; }
  const std::string& referenceSymbol() const noexcept { return _referenceSymbol; }
  TimePoint referenceTime() const noexcept { return _referenceTime; }

 private:
  std::string _symbol;
  TimePoint _time;
  std::string _referenceSymbol;
  TimePoint _referenceTime;
};

class MissingSymbol : public std::out_of_range
{
 public:
  explicit MissingSymbol(std::string symbol);

  const std::string& symbol() const noexcept { return _symbol; }

 private:
  std::string _symbol;
};

// Adjusted prices requested from a bar whose raw close is zero.
class UndefinedAdjustment : public std::domain_error
{
 public:
  explicit UndefinedAdjustment(const std::string& barText);
};

}  // namespace tradelib
