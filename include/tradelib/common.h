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

namespace tradelib
{

// Raw and adjusted prices are plain reals; feeds deliver them already scaled.
using Price = double;
using Volume = double;

}  // namespace tradelib
