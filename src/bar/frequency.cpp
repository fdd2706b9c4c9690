/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "tradelib/bar/frequency.h"

#include <array>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace tradelib
{

namespace
{

constexpr std::array<std::pair<Frequency, std::string_view>, 9> kFrequencyNames{{
    {Frequency::Minute, "minute"},
    {Frequency::Five, "five-minute"},
    {Frequency::Ten, "ten-minute"},
    {Frequency::Fifteen, "fifteen-minute"},
    {Frequency::Thirty, "thirty-minute"},
    {Frequency::Hour, "hour"},
    {Frequency::Day, "day"},
    {Frequency::Week, "week"},
    {Frequency::Month, "month"},
}};

constexpr std::array<Frequency, kFrequencyNames.size()> kAllFrequencies = []
{
  std::array<Frequency, kFrequencyNames.size()> out{};
  for (size_t i = 0; i < kFrequencyNames.size(); ++i)
  {
    out[i] = kFrequencyNames[i].first;
  }
  return out;
}();

const std::unordered_map<Frequency, std::string_view>& nameByFrequency()
{
  static const auto table = []
  {
    std::unordered_map<Frequency, std::string_view> m;
    for (const auto& [freq, name] : kFrequencyNames)
    {
      m.emplace(freq, name);
    }
    return m;
  }();
  return table;
}

const std::unordered_map<std::string_view, Frequency>& frequencyByName()
{
  static const auto table = []
  {
    std::unordered_map<std::string_view, Frequency> m;
    for (const auto& [freq, name] : kFrequencyNames)
    {
      m.emplace(name, freq);
    }
    return m;
  }();
  return table;
}

}  // namespace

std::string_view frequencyName(Frequency freq)
{
  const auto& table = nameByFrequency();
  auto it = table.find(freq);
  if (it == table.end())
  {
    throw std::invalid_argument("Unknown frequency value: " +
                                std::to_string(static_cast<uint16_t>(freq)));
  }
  return it->second;
}

Frequency parseFrequency(std::string_view name)
{
  auto freq = tryParseFrequency(name);
  if (!freq)
  {
    throw std::invalid_argument("Unknown frequency name: '" + std::string(name) + "'");
  }
  return *freq;
}

std::optional<Frequency> tryParseFrequency(std::string_view name) noexcept
{
  const auto& table = frequencyByName();
  auto it = table.find(name);
  if (it == table.end())
  {
    return std::nullopt;
  }
  return it->second;
}

std::span<const Frequency> allFrequencies() noexcept
{
  return kAllFrequencies;
}

bool isIntraday(Frequency freq) noexcept
{
  return intervalMinutes(freq).has_value();
}

std::optional<uint32_t> intervalMinutes(Frequency freq) noexcept
{
  switch (freq)
  {
    case Frequency::Minute:
    case Frequency::Five:
    case Frequency::Ten:
    case Frequency::Fifteen:
    case Frequency::Thirty:
    case Frequency::Hour:
      return static_cast<uint32_t>(freq);
    case Frequency::Day:
    case Frequency::Week:
    case Frequency::Month:
      break;
  }
  return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, Frequency freq)
{
  return os << frequencyName(freq);
}

}  // namespace tradelib
