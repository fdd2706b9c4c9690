/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "tradelib/bar/errors.h"

#include <utility>

namespace tradelib
{

namespace
{

std::string describeViolations(const std::vector<BarRule>& violations, const std::string& barText)
{
  std::string out;
  for (size_t i = 0; i < violations.size(); ++i)
  {
    if (i > 0)
    {
      out += '\n';
    }
    out += barRuleMessage(violations[i]);
    out += " (";
    out += barText;
    out += ')';
  }
  return out;
}

}  // namespace

std::string_view barRuleMessage(BarRule rule) noexcept
{
  switch (rule)
  {
    case BarRule::HighGeOpen:
      return "(H)igh !>= (O)pen.";
    case BarRule::HighGeLow:
      return "(H)igh !>= (L)ow.";
    case BarRule::HighGeClose:
      return "(H)igh !>= (C)lose.";
    case BarRule::LowLeOpen:
      return "(L)ow !<= (O)pen.";
    case BarRule::LowLeHigh:
      return "(L)ow !<= (H)igh.";
    case BarRule::LowLeClose:
      return "(L)ow !<= (C)lose.";
  }
  return "unknown rule";
}

InvariantViolation::InvariantViolation(std::vector<BarRule> violations, std::string barText)
    : std::invalid_argument(describeViolations(violations, barText)),
      _violations(std::move(violations)),
      _barText(std::move(barText))
{
}

EmptyInput::EmptyInput() : std::invalid_argument("No bars supplied") {}

DesynchronizedTimestamps::DesynchronizedTimestamps(std::string symbol, TimePoint time,
                                                   std::string referenceSymbol,
                                                   TimePoint referenceTime)
    : std::invalid_argument("Bar date times are not in sync. " + symbol + " " + formatIso(time) +
                            " != " + referenceSymbol + " " + formatIso(referenceTime)),
      _symbol(std::move(symbol)),
      _time(time),
      _referenceSymbol(std::move(referenceSymbol)),
      _referenceTime(referenceTime)
{
}

MissingSymbol::MissingSymbol(std::string symbol)
    : std::out_of_range("No bar for symbol: " + symbol), _symbol(std::move(symbol))
{
}

UndefinedAdjustment::UndefinedAdjustment(const std::string& barText)
    : std::domain_error("Adjusted price undefined for zero close (" + barText + ")")
{
}

}  // namespace tradelib
