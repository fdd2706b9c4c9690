/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string_view>

namespace tradelib
{

// Sampling interval of a bar sequence. Intraday values are the interval length in
// minutes; Day, Week and Month are tags outside the minute range.
enum class Frequency : uint16_t
{
  Minute = 1,
  Five = 5,
  Ten = 10,
  Fifteen = 15,
  Thirty = 30,
  Hour = 60,
  Day = 'd',
  Week = 'w',
  Month = 'm'
};

// Throws std::invalid_argument for a value that is not one of the nine tokens.
std::string_view frequencyName(Frequency freq);

// Throws std::invalid_argument for an unknown name.
Frequency parseFrequency(std::string_view name);

std::optional<Frequency> tryParseFrequency(std::string_view name) noexcept;

std::span<const Frequency> allFrequencies() noexcept;

bool isIntraday(Frequency freq) noexcept;

// Minutes per bar for intraday frequencies, nullopt for Day/Week/Month.
std::optional<uint32_t> intervalMinutes(Frequency freq) noexcept;

std::ostream& operator<<(std::ostream& os, Frequency freq);

}  // namespace tradelib
